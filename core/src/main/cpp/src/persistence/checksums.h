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
#include <cstddef>
#include <string>

namespace vstore {
namespace persist {

// CRC32C (Castagnoli), table driven. Guards engine headers, item frames
// and archive catalog snapshots.
class CRC32C {
public:
    CRC32C() : value_(~0u) {}

    void update(const void* data, size_t len);
    void update(const std::string& s) { update(s.data(), s.size()); }

    uint32_t finalize() const { return value_ ^ 0xFFFFFFFFu; }
    void reset() { value_ = ~0u; }

    static uint32_t compute(const void* data, size_t len);
    static uint32_t compute(const std::string& s) { return compute(s.data(), s.size()); }

private:
    uint32_t value_;
};

} // namespace persist
} // namespace vstore
