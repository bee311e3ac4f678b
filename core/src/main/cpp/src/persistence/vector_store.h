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
#include <cstdint>
#include <limits>
#include <mutex>
#include <string>
#include <vector>
#include "vector_engine.h"
#include "../util/time_util.h"

namespace vstore {
namespace persist {

/**
 * Narrow interface to the embedded vector engine. One physical collection
 * per collection_id; the catalog is never touched from here.
 */
class VectorStoreAdapter {
public:
    virtual ~VectorStoreAdapter() = default;

    virtual void create(const std::string& collection_id, uint32_t dimension) = 0;
    virtual void drop(const std::string& collection_id) = 0;
    virtual void rename(const std::string& old_id, const std::string& new_id) = 0;

    virtual bool exists(const std::string& collection_id) const = 0;
    virtual uint64_t count(const std::string& collection_id) const = 0;
    virtual uint32_t dimension(const std::string& collection_id) const = 0;
    virtual std::vector<std::string> list_ids(const std::string& collection_id) const = 0;
    virtual std::vector<VectorItem> read_items(const std::string& collection_id,
                                               size_t limit = std::numeric_limits<size_t>::max()) const = 0;

    virtual void add_items(const std::string& collection_id, const std::vector<VectorItem>& items) = 0;

    // Creates dst with src's dimension and copies every item; returns the copied count
    virtual uint64_t copy_collection(const std::string& src_id, const std::string& dst_id) = 0;

    virtual std::vector<std::string> list_collections() const = 0;
    virtual std::string collection_dir(const std::string& collection_id) const = 0;
};

/**
 * FileVectorStore - physical collections under <data_root>/collections.
 *
 * create() builds the directory under a staging name and renames it into
 * place. drop() moves the directory into trash/ and removes it from there;
 * a failed removal is recorded in pending_cleanup.json and retried by
 * run_pending_cleanup().
 */
class FileVectorStore : public VectorStoreAdapter {
public:
    explicit FileVectorStore(const std::string& data_root, Clock clock = system_clock());

    void create(const std::string& collection_id, uint32_t dimension) override;
    void drop(const std::string& collection_id) override;
    void rename(const std::string& old_id, const std::string& new_id) override;

    bool exists(const std::string& collection_id) const override;
    uint64_t count(const std::string& collection_id) const override;
    uint32_t dimension(const std::string& collection_id) const override;
    std::vector<std::string> list_ids(const std::string& collection_id) const override;
    std::vector<VectorItem> read_items(const std::string& collection_id,
                                       size_t limit = std::numeric_limits<size_t>::max()) const override;

    void add_items(const std::string& collection_id, const std::vector<VectorItem>& items) override;
    uint64_t copy_collection(const std::string& src_id, const std::string& dst_id) override;

    std::vector<std::string> list_collections() const override;
    std::string collection_dir(const std::string& collection_id) const override;

    // Retries removals recorded by drop(); returns how many succeeded
    size_t run_pending_cleanup();
    std::vector<std::string> pending_cleanup() const;

private:
    void require_valid_id(const std::string& collection_id) const;
    void record_pending(const std::string& path);
    std::vector<std::string> load_pending() const;
    void store_pending(const std::vector<std::string>& paths);

    std::string data_root_;
    std::string collections_root_;
    std::string trash_root_;
    Clock clock_;

    // Serializes header read-modify-write in add_items and pending_cleanup.json updates
    mutable std::mutex mu_;
};

} // namespace persist
} // namespace vstore
