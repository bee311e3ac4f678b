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
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "collection_record.h"
#include "../util/time_util.h"

namespace vstore {
namespace persist {

/**
 * Durable map collection_id -> CollectionRecord.
 *
 * Every mutation is durable when the call returns. Failures throw
 * StorageUnavailableError and leave the previous state in place.
 */
class CatalogRepository {
public:
    virtual ~CatalogRepository() = default;

    // 1) Lifecycle
    virtual void load() = 0;
    virtual void reload() = 0;

    // 2) Lookup
    virtual std::optional<CollectionRecord> get(const std::string& collection_id) const = 0;
    virtual bool contains(const std::string& collection_id) const = 0;
    virtual std::vector<CollectionRecord> list() const = 0;
    virtual std::optional<CollectionRecord> find_by_display_name(const std::string& display_name) const = 0;
    virtual size_t size() const = 0;

    // 3) Mutation
    virtual void put(const CollectionRecord& record) = 0;
    // Returns false if the id was not present
    virtual bool remove(const std::string& collection_id) = 0;
    virtual void replace_all(const std::vector<CollectionRecord>& records) = 0;
};

/**
 * JsonCatalogStore - catalog.json under the data root.
 *
 * The whole document is rewritten through temp file + fsync + rename on
 * every mutation; the in-memory map only changes after the write succeeded.
 */
class JsonCatalogStore : public CatalogRepository {
public:
    explicit JsonCatalogStore(const std::string& data_root, Clock clock = system_clock());

    void load() override;
    void reload() override;

    std::optional<CollectionRecord> get(const std::string& collection_id) const override;
    bool contains(const std::string& collection_id) const override;
    std::vector<CollectionRecord> list() const override;
    std::optional<CollectionRecord> find_by_display_name(const std::string& display_name) const override;
    size_t size() const override;

    void put(const CollectionRecord& record) override;
    bool remove(const std::string& collection_id) override;
    void replace_all(const std::vector<CollectionRecord>& records) override;

    std::string get_catalog_path() const;

private:
    // Caller holds mu_
    void persist_locked(const std::map<std::string, CollectionRecord>& next);

    std::string data_root_;
    Clock clock_;
    mutable std::mutex mu_;
    std::map<std::string, CollectionRecord> records_;
};

} // namespace persist
} // namespace vstore
