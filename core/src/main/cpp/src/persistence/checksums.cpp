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

#include "checksums.h"
#include <array>

namespace vstore {
namespace persist {

namespace {

// Reflected Castagnoli polynomial
constexpr uint32_t kPolynomial = 0x82F63B78u;

std::array<uint32_t, 256> make_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t r = i;
        for (int k = 0; k < 8; ++k) {
            r = (r >> 1) ^ (-(int32_t)(r & 1) & kPolynomial);
        }
        table[i] = r;
    }
    return table;
}

const std::array<uint32_t, 256>& table() {
    static const std::array<uint32_t, 256> t = make_table();
    return t;
}

} // namespace

void CRC32C::update(const void* data, size_t len) {
    if (len == 0 || data == nullptr) return;

    const auto& t = table();
    const uint8_t* p = static_cast<const uint8_t*>(data);
    uint32_t crc = value_;
    while (len--) {
        crc = (crc >> 8) ^ t[(crc ^ *p++) & 0xFF];
    }
    value_ = crc;
}

uint32_t CRC32C::compute(const void* data, size_t len) {
    CRC32C crc;
    crc.update(data, len);
    return crc.finalize();
}

} // namespace persist
} // namespace vstore
