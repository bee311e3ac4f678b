/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace vstore {
namespace persist {

/**
 * Per-collection advisory locks for mutating operations.
 *
 * At most one mutation holds a given collection_id; different ids never
 * contend. Readers (checks, scans) do not lock; they call is_locked() to
 * tell an in-flight operation from real drift.
 *
 * Ids whose rollback failed are halted and refuse new operations until an
 * operator clears them.
 */
class OperationLockTable {
public:
    class Guard {
    public:
        Guard() = default;
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&& other) noexcept;
        ~Guard();

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        const std::vector<std::string>& ids() const { return ids_; }
        bool owns() const { return table_ != nullptr; }
        void release();

    private:
        friend class OperationLockTable;
        Guard(OperationLockTable* table, std::vector<std::string> ids)
            : table_(table), ids_(std::move(ids)) {}

        OperationLockTable* table_ = nullptr;
        std::vector<std::string> ids_;
    };

    // Blocks until id is free
    Guard acquire(const std::string& id);

    // Takes every id at once, in sorted order; duplicates are ignored
    Guard acquire_all(std::vector<std::string> ids);

    bool is_locked(const std::string& id) const;
    size_t held_count() const;

    // Halted-id registry
    void halt(const std::string& id, const std::string& reason);
    bool is_halted(const std::string& id) const;
    std::optional<std::string> halt_reason(const std::string& id) const;
    bool clear_halt(const std::string& id);
    std::map<std::string, std::string> halted() const;

private:
    void release_ids(const std::vector<std::string>& ids);

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::set<std::string> held_;
    std::map<std::string, std::string> halted_;
};

} // namespace persist
} // namespace vstore
