//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#ifndef ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_STATE_DB_HPP_
#define ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_STATE_DB_HPP_

#include <zkwasm/bus_mapping/operation.hpp>
#include <zkwasm/bus_mapping/word.hpp>

#include <evmc/evmc.hpp>

#include <cstdint>
#include <map>
#include <set>
#include <utility>

namespace zkwasm {
    namespace bus_mapping {

        using namespace evmc::literals;

        /// keccak256 of the empty byte string.
        constexpr evmc::bytes32 EMPTY_CODE_HASH =
            0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470_bytes32;

        struct account {
            std::uint64_t nonce = 0;
            word balance;
            evmc::bytes32 code_hash = EMPTY_CODE_HASH;
        };

        /// Contracts code keyed by its keccak256 hash.
        class code_db {
        public:
            evmc::bytes32 insert(const bytes& code);
            const bytes* get(const evmc::bytes32& hash) const;

        private:
            std::map<evmc::bytes32, bytes> m_codes;
        };

        /// Account, storage and access list snapshot threaded through a
        /// block build.
        class state_db {
        public:
            using storage_key = std::pair<evmc::address, word>;

            const account& get_account(const evmc::address& addr) const;
            bool account_exists(const evmc::address& addr) const;
            void set_account(const evmc::address& addr, const account& acc);

            word get_storage(const evmc::address& addr, const word& key) const;
            word get_committed_storage(const evmc::address& addr, const word& key) const;
            /// Initial value, both current and committed.
            void set_storage(const evmc::address& addr, const word& key, const word& value);

            bool check_account_in_access_list(const evmc::address& addr) const;
            /// Returns true when the account was cold.
            bool add_account_to_access_list(const evmc::address& addr);
            bool check_account_storage_in_access_list(const evmc::address& addr, const word& key) const;
            bool add_account_storage_to_access_list(const evmc::address& addr, const word& key);

            std::uint64_t refund() const {
                return m_refund;
            }

            void set_refund(std::uint64_t value) {
                m_refund = value;
            }

            // Effects of reversible operations.
            void apply(const storage_op& op);
            void apply(const account_op& op);
            void apply(const tx_refund_op& op);
            void apply(const tx_access_list_account_op& op);
            void apply(const tx_access_list_account_storage_op& op);

            /// Transaction boundary: current storage becomes committed, the
            /// access lists are cleared and the refund resets.
            void commit_tx();

        private:
            std::map<evmc::address, account> m_accounts;
            std::map<storage_key, word> m_storage;
            std::map<storage_key, word> m_committed_storage;
            std::set<evmc::address> m_access_list_account;
            std::set<storage_key> m_access_list_account_storage;
            std::uint64_t m_refund = 0;
        };

    }    // namespace bus_mapping
}    // namespace zkwasm

#endif    // ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_STATE_DB_HPP_
