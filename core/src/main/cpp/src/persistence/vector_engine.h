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
#include <array>
#include <cstdint>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace vstore {
namespace persist {

struct VectorItem {
    std::string id;
    std::vector<float> values;

    bool operator==(const VectorItem& o) const { return id == o.id && values == o.values; }
};

/*
 * header.bin (48 bytes, little-endian)
 *
 *   0  u32 magic "VSC1"
 *   4  u32 format version
 *   8  u32 dimension
 *  12  u32 reserved
 *  16  u64 item count
 *  24  i64 created_unix_ms
 *  32  16 reserved bytes
 *  44  u32 crc32c of bytes [0, 44)
 */
struct EngineHeader {
    uint32_t format_version = 0;
    uint32_t dimension = 0;
    uint64_t item_count = 0;
    int64_t  created_unix_ms = 0;
};

std::array<uint8_t, 48> encode_header(const EngineHeader& h);

// Returns false and fills *why on a short buffer, bad magic, unknown format or bad crc
bool decode_header(const uint8_t* data, size_t len, EngineHeader* out, std::string* why);

/**
 * EngineFiles - reads and writes the two files of a physical collection.
 *
 * Throws NotFoundError for missing files, IntegrityError for structural
 * corruption and StorageUnavailableError for I/O failures.
 */
class EngineFiles {
public:
    static std::string header_path(const std::string& dir);
    static std::string vectors_path(const std::string& dir);

    static EngineHeader read_header(const std::string& dir);
    static void write_header(const std::string& dir, const EngineHeader& header);

    // Items are self-describing; the header is not needed to read them.
    // Stops after limit items.
    static std::vector<VectorItem> read_items(const std::string& dir,
                                              size_t limit = std::numeric_limits<size_t>::max());
    static uint64_t count_items(const std::string& dir);

    // Appends frames and makes them durable; the header is left to the caller
    static void append_items(const std::string& dir, const std::vector<VectorItem>& items);

    static std::string encode_item(const VectorItem& item);
};

} // namespace persist
} // namespace vstore
