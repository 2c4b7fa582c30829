//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#ifndef ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_WORD_HPP_
#define ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_WORD_HPP_

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <ethash/keccak.hpp>

#include <array>
#include <cassert>
#include <cstdint>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

namespace zkwasm {
    namespace bus_mapping {

        using bytes = std::vector<std::uint8_t>;

        constexpr std::size_t WORD_BYTE_LENGTH = 32;

        struct word {
            using value_type = intx::uint256;
            static constexpr std::uint64_t size = sizeof(value_type);

            // constructors
            word() {
                value = 0;
            }

            template<typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
            word(T v) {
                value = static_cast<std::uint64_t>(v);
            }

            word(const intx::uint256& v) {
                value = v;
            }

            word(const evmc::bytes32& v) {
                value = intx::be::load<intx::uint256>(v);
            }

            word(const evmc::address& addr) {
                value = intx::be::load<intx::uint256>(addr);
            }

            word(const ethash::hash256& hash) {
                value = intx::be::load<intx::uint256>(hash);
            }

            // Big-endian run of at most 32 bytes, right aligned.
            word(const std::uint8_t* data, std::size_t len) {
                assert(len <= WORD_BYTE_LENGTH);
                std::array<std::uint8_t, WORD_BYTE_LENGTH> padded{};
                for (std::size_t i = 0; i < len; ++i) {
                    padded[WORD_BYTE_LENGTH - len + i] = data[i];
                }
                value = intx::be::unsafe::load<intx::uint256>(padded.data());
            }

            // operators
            word operator+(const word& other) const {
                return word(value + other.value);
            }

            word operator-(const word& other) const {
                return word(value - other.value);
            }

            word operator&(const word& other) const {
                return word(value & other.value);
            }

            word operator|(const word& other) const {
                return word(value | other.value);
            }

            word operator^(const word& other) const {
                return word(value ^ other.value);
            }

            bool operator==(const word& other) const {
                return value == other.value;
            }

            bool operator!=(const word& other) const {
                return value != other.value;
            }

            bool operator<(const word& other) const {
                return value < other.value;
            }

            bool is_zero() const {
                return value == 0;
            }

            bool is_uint64() const {
                return value[1] == 0 && value[2] == 0 && value[3] == 0;
            }

            // convertions
            std::uint64_t to_uint64(std::size_t i = 0) const {
                return static_cast<std::uint64_t>(value[i]);
            }

            evmc::address to_address() const {
                return intx::be::trunc<evmc::address>(value);
            }

            evmc::bytes32 to_bytes32() const {
                return intx::be::store<evmc::bytes32>(value);
            }

            ethash::hash256 to_hash() const {
                return intx::be::store<ethash::hash256>(value);
            }

            std::array<std::uint8_t, WORD_BYTE_LENGTH> to_be_bytes() const {
                std::array<std::uint8_t, WORD_BYTE_LENGTH> res;
                intx::be::unsafe::store(res.data(), value);
                return res;
            }

            std::string to_string() const {
                return "0x" + intx::to_string(value, 16);
            }

            const value_type& get_value() const {
                return value;
            }

        private:
            intx::uint256 value;
        };

        inline std::ostream& operator<<(std::ostream& os, const word& w) {
            os << w.to_string();
            return os;
        }

    }    // namespace bus_mapping
}    // namespace zkwasm

#endif    // ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_WORD_HPP_
