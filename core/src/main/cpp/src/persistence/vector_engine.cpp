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

#include "vector_engine.h"
#include "checksums.h"
#include "config.h"
#include "errors.h"
#include "platform_fs.h"
#include "../util/log.h"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>

namespace vstore {
namespace persist {

namespace fs = std::filesystem;

namespace {

template <typename T>
void put_le(uint8_t* dst, T v) {
    std::memcpy(dst, &v, sizeof(T));
}

template <typename T>
T get_le(const uint8_t* src) {
    T v;
    std::memcpy(&v, src, sizeof(T));
    return v;
}

constexpr size_t kCrcOffset = 44;

// Called once per decoded frame
using FrameVisitor = std::function<void(VectorItem&& item)>;

void scan_frames(const std::string& dir, size_t limit, bool keep_values, const FrameVisitor& visit) {
    std::string path = EngineFiles::vectors_path(dir);
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        std::error_code ec;
        if (!fs::exists(path, ec) && !ec) {
            throw NotFoundError("missing " + path);
        }
        throw StorageUnavailableError("cannot open " + path);
    }

    uint64_t offset = 0;
    size_t seen = 0;
    std::string frame;
    while (seen < limit) {
        uint8_t len_buf[4];
        in.read(reinterpret_cast<char*>(len_buf), 4);
        if (in.gcount() == 0 && in.eof()) {
            break;
        }
        if (in.gcount() != 4) {
            throw IntegrityError("truncated item header at offset " + std::to_string(offset) + " in " + path);
        }
        uint32_t id_len = get_le<uint32_t>(len_buf);
        if (id_len == 0 || id_len > engine::kMaxIdLength) {
            throw IntegrityError("bad item id length " + std::to_string(id_len) +
                                 " at offset " + std::to_string(offset) + " in " + path);
        }

        frame.assign(reinterpret_cast<const char*>(len_buf), 4);
        frame.resize(4 + id_len + 4);
        in.read(&frame[4], id_len + 4);
        if (static_cast<size_t>(in.gcount()) != id_len + 4) {
            throw IntegrityError("truncated item at offset " + std::to_string(offset) + " in " + path);
        }
        uint32_t dim = get_le<uint32_t>(reinterpret_cast<const uint8_t*>(&frame[4 + id_len]));
        if (dim == 0 || dim > engine::kMaxDimension) {
            throw IntegrityError("bad item dimension " + std::to_string(dim) +
                                 " at offset " + std::to_string(offset) + " in " + path);
        }

        size_t body = static_cast<size_t>(dim) * sizeof(float);
        size_t head = frame.size();
        frame.resize(head + body + 4);
        in.read(&frame[head], body + 4);
        if (static_cast<size_t>(in.gcount()) != body + 4) {
            throw IntegrityError("truncated item vector at offset " + std::to_string(offset) + " in " + path);
        }

        uint32_t stored = get_le<uint32_t>(reinterpret_cast<const uint8_t*>(&frame[head + body]));
        uint32_t actual = CRC32C::compute(frame.data(), head + body);
        if (stored != actual) {
            throw IntegrityError("item checksum mismatch at offset " + std::to_string(offset) + " in " + path);
        }

        VectorItem item;
        item.id.assign(&frame[4], id_len);
        item.values.resize(dim);
        if (keep_values) {
            std::memcpy(item.values.data(), &frame[head], body);
        }
        visit(std::move(item));

        offset += frame.size();
        seen++;
    }
    if (in.bad()) {
        throw StorageUnavailableError("read error in " + path);
    }
}

} // namespace

std::array<uint8_t, 48> encode_header(const EngineHeader& h) {
    std::array<uint8_t, 48> buf{};
    put_le<uint32_t>(&buf[0], engine::kMagic);
    put_le<uint32_t>(&buf[4], h.format_version ? h.format_version : engine::kFormatVersion);
    put_le<uint32_t>(&buf[8], h.dimension);
    put_le<uint64_t>(&buf[16], h.item_count);
    put_le<int64_t>(&buf[24], h.created_unix_ms);
    put_le<uint32_t>(&buf[kCrcOffset], CRC32C::compute(buf.data(), kCrcOffset));
    return buf;
}

bool decode_header(const uint8_t* data, size_t len, EngineHeader* out, std::string* why) {
    auto fail = [why](const std::string& msg) {
        if (why) *why = msg;
        return false;
    };

    if (len != engine::kHeaderSize) {
        return fail("header is " + std::to_string(len) + " bytes");
    }
    if (get_le<uint32_t>(data) != engine::kMagic) {
        return fail("bad magic");
    }
    if (get_le<uint32_t>(data + kCrcOffset) != CRC32C::compute(data, kCrcOffset)) {
        return fail("header checksum mismatch");
    }
    uint32_t version = get_le<uint32_t>(data + 4);
    if (version == 0 || version > engine::kFormatVersion) {
        return fail("unsupported format version " + std::to_string(version));
    }
    uint32_t dim = get_le<uint32_t>(data + 8);
    if (dim == 0 || dim > engine::kMaxDimension) {
        return fail("bad dimension " + std::to_string(dim));
    }

    out->format_version = version;
    out->dimension = dim;
    out->item_count = get_le<uint64_t>(data + 16);
    out->created_unix_ms = get_le<int64_t>(data + 24);
    return true;
}

std::string EngineFiles::header_path(const std::string& dir) {
    return (fs::path(dir) / engine::kHeaderFile).string();
}

std::string EngineFiles::vectors_path(const std::string& dir) {
    return (fs::path(dir) / engine::kVectorsFile).string();
}

EngineHeader EngineFiles::read_header(const std::string& dir) {
    std::string path = header_path(dir);
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        std::error_code ec;
        if (!fs::exists(path, ec) && !ec) {
            throw NotFoundError("missing " + path);
        }
        throw StorageUnavailableError("cannot open " + path);
    }

    // One byte more than a header so oversized files are detected
    uint8_t buf[engine::kHeaderSize + 1];
    in.read(reinterpret_cast<char*>(buf), sizeof(buf));
    if (in.bad()) {
        throw StorageUnavailableError("read error in " + path);
    }

    EngineHeader h;
    std::string why;
    if (!decode_header(buf, static_cast<size_t>(in.gcount()), &h, &why)) {
        throw IntegrityError(path + ": " + why);
    }
    return h;
}

void EngineFiles::write_header(const std::string& dir, const EngineHeader& header) {
    auto buf = encode_header(header);
    FSResult r = PlatformFS::write_file_atomic(header_path(dir),
                                               std::string(reinterpret_cast<const char*>(buf.data()), buf.size()));
    if (!r.ok) {
        throw StorageUnavailableError("cannot write " + header_path(dir) + ": " + errnoWithDescription(r.err));
    }
}

std::vector<VectorItem> EngineFiles::read_items(const std::string& dir, size_t limit) {
    std::vector<VectorItem> items;
    scan_frames(dir, limit, true, [&items](VectorItem&& item) {
        items.push_back(std::move(item));
    });
    return items;
}

uint64_t EngineFiles::count_items(const std::string& dir) {
    uint64_t n = 0;
    scan_frames(dir, std::numeric_limits<size_t>::max(), false, [&n](VectorItem&&) { n++; });
    return n;
}

std::string EngineFiles::encode_item(const VectorItem& item) {
    uint32_t id_len = static_cast<uint32_t>(item.id.size());
    uint32_t dim = static_cast<uint32_t>(item.values.size());
    size_t body = item.values.size() * sizeof(float);

    std::string frame(4 + id_len + 4 + body + 4, '\0');
    uint8_t* p = reinterpret_cast<uint8_t*>(&frame[0]);
    put_le<uint32_t>(p, id_len);
    std::memcpy(p + 4, item.id.data(), id_len);
    put_le<uint32_t>(p + 4 + id_len, dim);
    if (body) {
        std::memcpy(p + 8 + id_len, item.values.data(), body);
    }
    size_t crc_at = 8 + id_len + body;
    put_le<uint32_t>(p + crc_at, CRC32C::compute(p, crc_at));
    return frame;
}

void EngineFiles::append_items(const std::string& dir, const std::vector<VectorItem>& items) {
    if (items.empty()) {
        return;
    }

    std::string batch;
    for (const auto& item : items) {
        if (item.id.empty() || item.id.size() > engine::kMaxIdLength) {
            throw InvalidArgumentError("item id must be 1-" + std::to_string(engine::kMaxIdLength) + " bytes");
        }
        if (item.values.empty() || item.values.size() > engine::kMaxDimension) {
            throw InvalidArgumentError("item '" + item.id + "' has " + std::to_string(item.values.size()) +
                                       " components");
        }
        batch += encode_item(item);
    }

    std::string path = vectors_path(dir);
    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        throw StorageUnavailableError("cannot open " + path + " for append");
    }
    out.write(batch.data(), static_cast<std::streamsize>(batch.size()));
    out.close();
    if (out.fail()) {
        throw StorageUnavailableError("short write to " + path);
    }

    FSResult r = PlatformFS::fsync_file(path);
    if (!r.ok) {
        throw StorageUnavailableError("fsync failed for " + path + ": " + errnoWithDescription(r.err));
    }
}

} // namespace persist
} // namespace vstore
