//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#include <zkwasm/bus_mapping/word.hpp>

#include <evmc/evmc.hpp>
#include <ethash/keccak.hpp>
#include <intx/intx.hpp>

#include <gtest/gtest.h>

#include <array>
#include <iomanip>
#include <limits>
#include <sstream>

using zkwasm::bus_mapping::word;

inline void check_eq(const uint8_t* l, const uint8_t* r, size_t len) {
    for (size_t i = 0; i < len; i++) {
        EXPECT_EQ(l[i], r[i]);
    }
}

inline std::string bytes_to_string(const uint8_t* data, int len) {
    std::stringstream ss;
    ss << std::hex;

    for (int i(0); i < len; ++i) {
        ss << std::setw(2) << std::setfill('0') << (int)data[i];
    }

    // Cut all preceding zeros
    std::string res = ss.str();
    while (res[0] == '0')
        res.erase(0, 1);

    return res;
}

TEST(WordTest, conversions_bytes32_to_word) {
    evmc::bytes32 bytes32_number;
    bytes32_number.bytes[2] = 10;    // Some big number, 10 << 232
    auto tmp = word(bytes32_number);
    ASSERT_EQ(bytes_to_string(bytes32_number.bytes, 32), intx::to_string(tmp.get_value(), 16));
    evmc::bytes32 bytes32_result = tmp.to_bytes32();
    check_eq(bytes32_number.bytes, bytes32_result.bytes, 32);
    EXPECT_FALSE(tmp.is_uint64());
}

TEST(WordTest, conversions_address_to_word) {
    evmc::address address;
    address.bytes[0] = 1;
    address.bytes[19] = 10;
    auto tmp = word(address);
    ASSERT_EQ(bytes_to_string(address.bytes, 20), intx::to_string(tmp.get_value(), 16));
    evmc::address address_result = tmp.to_address();
    check_eq(address.bytes, address_result.bytes, 20);
}

TEST(WordTest, conversions_hash_to_word) {
    const auto hash = ethash::keccak256(nullptr, 0);
    auto tmp = word(hash);
    ASSERT_EQ(bytes_to_string(hash.bytes, 32), intx::to_string(tmp.get_value(), 16));
    ethash::hash256 hash_result = tmp.to_hash();
    check_eq(hash.bytes, hash_result.bytes, 32);
}

TEST(WordTest, conversions_uint64_to_word) {
    uint64_t number = std::numeric_limits<uint64_t>::max();
    auto tmp = word(number);
    std::ostringstream ss;
    ss << std::hex << number;
    ASSERT_EQ(ss.str(), intx::to_string(tmp.get_value(), 16));
    EXPECT_TRUE(tmp.is_uint64());
    EXPECT_EQ(tmp.to_uint64(), number);
    EXPECT_FALSE((tmp + word(1)).is_uint64());
}

TEST(WordTest, load_partial_big_endian) {
    const std::array<uint8_t, 3> data = {0x01, 0x02, 0x03};
    auto tmp = word(data.data(), data.size());
    EXPECT_EQ(tmp, word(0x010203));
    const auto be = tmp.to_be_bytes();
    EXPECT_EQ(be[29], 0x01);
    EXPECT_EQ(be[30], 0x02);
    EXPECT_EQ(be[31], 0x03);
    for (std::size_t i = 0; i < 29; ++i) {
        EXPECT_EQ(be[i], 0);
    }
}

TEST(WordTest, arithmetic_wraps_at_256_bits) {
    const word zero;
    const word max = zero - word(1);
    EXPECT_EQ(max + word(1), zero);
    EXPECT_EQ(max & word(0xff), word(0xff));
    EXPECT_EQ(word(0xf0) | word(0x0f), word(0xff));
    EXPECT_EQ(word(0xff) ^ word(0x0f), word(0xf0));
    EXPECT_TRUE(word(1) < word(2));
    EXPECT_TRUE(zero.is_zero());
}

TEST(WordTest, to_string_is_hex) {
    EXPECT_EQ(word(0x6f).to_string(), "0x6f");
    std::ostringstream ss;
    ss << word(255);
    EXPECT_EQ(ss.str(), "0xff");
}
