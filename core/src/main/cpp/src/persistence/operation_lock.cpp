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

#include "operation_lock.h"
#include "../util/log.h"
#include <algorithm>

namespace vstore {
namespace persist {

OperationLockTable::Guard::Guard(Guard&& other) noexcept
    : table_(other.table_), ids_(std::move(other.ids_)) {
    other.table_ = nullptr;
    other.ids_.clear();
}

OperationLockTable::Guard& OperationLockTable::Guard::operator=(Guard&& other) noexcept {
    if (this != &other) {
        release();
        table_ = other.table_;
        ids_ = std::move(other.ids_);
        other.table_ = nullptr;
        other.ids_.clear();
    }
    return *this;
}

OperationLockTable::Guard::~Guard() {
    release();
}

void OperationLockTable::Guard::release() {
    if (table_) {
        table_->release_ids(ids_);
        table_ = nullptr;
    }
}

OperationLockTable::Guard OperationLockTable::acquire(const std::string& id) {
    return acquire_all({id});
}

OperationLockTable::Guard OperationLockTable::acquire_all(std::vector<std::string> ids) {
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this, &ids] {
        for (const auto& id : ids) {
            if (held_.count(id)) return false;
        }
        return true;
    });
    held_.insert(ids.begin(), ids.end());
    trace() << "Locked " << ids.size() << " collection id(s)";
    return Guard(this, std::move(ids));
}

void OperationLockTable::release_ids(const std::vector<std::string>& ids) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        for (const auto& id : ids) {
            held_.erase(id);
        }
    }
    cv_.notify_all();
}

bool OperationLockTable::is_locked(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return held_.count(id) != 0;
}

size_t OperationLockTable::held_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return held_.size();
}

void OperationLockTable::halt(const std::string& id, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mu_);
    halted_[id] = reason;
    severe() << "Collection " << id << " halted: " << reason;
}

bool OperationLockTable::is_halted(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return halted_.count(id) != 0;
}

std::optional<std::string> OperationLockTable::halt_reason(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = halted_.find(id);
    if (it == halted_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool OperationLockTable::clear_halt(const std::string& id) {
    std::lock_guard<std::mutex> lock(mu_);
    bool erased = halted_.erase(id) != 0;
    if (erased) {
        warn() << "Halt cleared for collection " << id;
    }
    return erased;
}

std::map<std::string, std::string> OperationLockTable::halted() const {
    std::lock_guard<std::mutex> lock(mu_);
    return halted_;
}

} // namespace persist
} // namespace vstore
