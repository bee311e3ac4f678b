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

#include <gtest/gtest.h>
#include <vector>
#include <cstring>
#include <iomanip>
#include "persistence/checksums.h"
#include "persistence/vector_engine.h"

using namespace vstore::persist;

class ChecksumsTest : public ::testing::Test {
protected:
    std::vector<uint8_t> test_data;

    void SetUp() override {
        test_data.resize(1024);
        for (size_t i = 0; i < test_data.size(); i++) {
            test_data[i] = static_cast<uint8_t>(i & 0xFF);
        }
    }
};

TEST_F(ChecksumsTest, CRC32CKnownValues) {
    struct TestCase {
        const char* data;
        uint32_t expected;
    };

    // Castagnoli test vectors
    TestCase cases[] = {
        {"", 0x00000000},
        {"123456789", 0xE3069283},
        {"The quick brown fox jumps over the lazy dog", 0x22620404},
        {"a", 0xC1D04330},
        {"abc", 0x364B3FB7},
    };

    for (const auto& tc : cases) {
        uint32_t result = CRC32C::compute(tc.data, strlen(tc.data));
        EXPECT_EQ(result, tc.expected)
            << "CRC32C mismatch for \"" << tc.data << "\": got 0x"
            << std::hex << result << ", expected 0x" << tc.expected;
    }
}

TEST_F(ChecksumsTest, CRC32CIncremental) {
    CRC32C crc1, crc2;

    crc1.update(test_data.data(), test_data.size());
    uint32_t result1 = crc1.finalize();

    size_t chunk_size = 64;
    for (size_t i = 0; i < test_data.size(); i += chunk_size) {
        size_t len = std::min(chunk_size, test_data.size() - i);
        crc2.update(test_data.data() + i, len);
    }

    EXPECT_EQ(result1, crc2.finalize());
    EXPECT_EQ(result1, CRC32C::compute(test_data.data(), test_data.size()));
}

TEST_F(ChecksumsTest, StringOverloadMatchesBuffer) {
    std::string snapshot = "{\"schema_version\":2,\"collections\":[]}";
    EXPECT_EQ(CRC32C::compute(snapshot), CRC32C::compute(snapshot.data(), snapshot.size()));

    CRC32C crc;
    crc.update(snapshot);
    EXPECT_EQ(crc.finalize(), CRC32C::compute(snapshot));

    crc.reset();
    EXPECT_EQ(crc.finalize(), 0u);
}

TEST_F(ChecksumsTest, SingleBitFlipChangesChecksum) {
    uint32_t base = CRC32C::compute(test_data.data(), test_data.size());
    for (size_t pos : {size_t(0), size_t(511), size_t(1023)}) {
        auto copy = test_data;
        copy[pos] ^= 0x01;
        EXPECT_NE(CRC32C::compute(copy.data(), copy.size()), base) << "flip at " << pos;
    }
}

TEST_F(ChecksumsTest, EngineHeaderRejectsCorruption) {
    EngineHeader h;
    h.format_version = 1;
    h.dimension = 384;
    h.item_count = 500;
    h.created_unix_ms = 1760000000000LL;

    auto bytes = encode_header(h);

    EngineHeader out;
    std::string why;
    ASSERT_TRUE(decode_header(bytes.data(), bytes.size(), &out, &why)) << why;
    EXPECT_EQ(out.dimension, 384u);
    EXPECT_EQ(out.item_count, 500u);
    EXPECT_EQ(out.created_unix_ms, 1760000000000LL);

    // Dimension field damaged: the trailing crc no longer matches
    bytes[8] ^= 0x40;
    EXPECT_FALSE(decode_header(bytes.data(), bytes.size(), &out, &why));
    EXPECT_FALSE(why.empty());

    // Short buffer
    EXPECT_FALSE(decode_header(bytes.data(), 20, &out, &why));
}
