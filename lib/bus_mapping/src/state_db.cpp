//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#include <zkwasm/bus_mapping/state_db.hpp>

#include <ethash/keccak.hpp>

namespace zkwasm {
    namespace bus_mapping {

        evmc::bytes32 code_db::insert(const bytes& code) {
            const auto hash = word(ethash::keccak256(code.data(), code.size())).to_bytes32();
            m_codes[hash] = code;
            return hash;
        }

        const bytes* code_db::get(const evmc::bytes32& hash) const {
            const auto it = m_codes.find(hash);
            if (it == m_codes.end()) {
                return nullptr;
            }
            return &it->second;
        }

        const account& state_db::get_account(const evmc::address& addr) const {
            static const account empty_account;
            const auto it = m_accounts.find(addr);
            if (it == m_accounts.end()) {
                return empty_account;
            }
            return it->second;
        }

        bool state_db::account_exists(const evmc::address& addr) const {
            return m_accounts.find(addr) != m_accounts.end();
        }

        void state_db::set_account(const evmc::address& addr, const account& acc) {
            m_accounts[addr] = acc;
        }

        word state_db::get_storage(const evmc::address& addr, const word& key) const {
            const auto it = m_storage.find({addr, key});
            return it == m_storage.end() ? word(0) : it->second;
        }

        word state_db::get_committed_storage(const evmc::address& addr, const word& key) const {
            const auto it = m_committed_storage.find({addr, key});
            return it == m_committed_storage.end() ? word(0) : it->second;
        }

        void state_db::set_storage(const evmc::address& addr, const word& key, const word& value) {
            m_storage[{addr, key}] = value;
            m_committed_storage[{addr, key}] = value;
        }

        bool state_db::check_account_in_access_list(const evmc::address& addr) const {
            return m_access_list_account.count(addr) != 0;
        }

        bool state_db::add_account_to_access_list(const evmc::address& addr) {
            return m_access_list_account.insert(addr).second;
        }

        bool state_db::check_account_storage_in_access_list(const evmc::address& addr, const word& key) const {
            return m_access_list_account_storage.count({addr, key}) != 0;
        }

        bool state_db::add_account_storage_to_access_list(const evmc::address& addr, const word& key) {
            return m_access_list_account_storage.insert({addr, key}).second;
        }

        void state_db::apply(const storage_op& op) {
            m_storage[{op.address, op.key}] = op.value;
        }

        void state_db::apply(const account_op& op) {
            auto& acc = m_accounts[op.address];
            switch (op.field) {
                case account_field::Nonce:
                    acc.nonce = op.value.to_uint64();
                    break;
                case account_field::Balance:
                    acc.balance = op.value;
                    break;
                case account_field::CodeHash:
                    acc.code_hash = op.value.to_bytes32();
                    break;
            }
        }

        void state_db::apply(const tx_refund_op& op) {
            m_refund = op.value;
        }

        // Warmth is never withdrawn within a transaction.
        void state_db::apply(const tx_access_list_account_op& op) {
            if (op.is_warm) {
                m_access_list_account.insert(op.address);
            }
        }

        void state_db::apply(const tx_access_list_account_storage_op& op) {
            if (op.is_warm) {
                m_access_list_account_storage.insert({op.address, op.key});
            }
        }

        void state_db::commit_tx() {
            m_committed_storage = m_storage;
            m_access_list_account.clear();
            m_access_list_account_storage.clear();
            m_refund = 0;
        }

    }    // namespace bus_mapping
}    // namespace zkwasm
