//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#ifndef ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_RW_TABLE_HPP_
#define ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_RW_TABLE_HPP_

#include <zkwasm/bus_mapping/operation_container.hpp>
#include <zkwasm/bus_mapping/word.hpp>

#include <cstdint>
#include <ostream>
#include <vector>

namespace zkwasm {
    namespace bus_mapping {

        struct rw_row {
            std::uint8_t op;           // operation tag
            std::size_t id;            // call_id for stack, memory, call context; tx_id for storage, refund, access list
            word address;              // 10 bit for stack, 64 bit for memory, 160 bit for accounts
            std::uint8_t field;        // call context, account, log and receipt field
            word storage_key;          // 256-bit, not used for stack, memory
            std::size_t rw_id;         // rw counter
            bool is_write;
            word value;                // full word for storage and stack, a byte for memory
            word value_prev;

            bool operator<(const rw_row& other) const {
                if (op != other.op) return op < other.op;
                if (id != other.id) return id < other.id;
                if (address != other.address) return address < other.address;
                if (field != other.field) return field < other.field;
                if (storage_key != other.storage_key) return storage_key < other.storage_key;
                if (rw_id != other.rw_id) return rw_id < other.rw_id;
                return false;
            }
        };

        // For testing purposes
        std::ostream& operator<<(std::ostream& os, const rw_row& obj);

        rw_row start_row();
        rw_row padding_row();

        rw_row to_rw_row(const operation<stack_op>& op);
        rw_row to_rw_row(const operation<memory_op>& op);
        rw_row to_rw_row(const operation<storage_op>& op);
        rw_row to_rw_row(const operation<call_context_op>& op);
        rw_row to_rw_row(const operation<account_op>& op);
        rw_row to_rw_row(const operation<tx_refund_op>& op);
        rw_row to_rw_row(const operation<tx_access_list_account_op>& op);
        rw_row to_rw_row(const operation<tx_access_list_account_storage_op>& op);
        rw_row to_rw_row(const operation<tx_log_op>& op);
        rw_row to_rw_row(const operation<tx_receipt_op>& op);

        /// Flattens every operation of the container into sorted rows behind
        /// a START row. With a non-zero `max_rws` the table is padded up to
        /// that many rows and throws capacity_exceeded when it does not fit.
        std::vector<rw_row> build_rw_table(const operation_container& container, std::size_t max_rws);

    }    // namespace bus_mapping
}    // namespace zkwasm

#endif    // ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_RW_TABLE_HPP_
