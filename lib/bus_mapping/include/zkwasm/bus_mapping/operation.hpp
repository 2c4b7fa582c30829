//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#ifndef ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_OPERATION_HPP_
#define ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_OPERATION_HPP_

#include <zkwasm/bus_mapping/word.hpp>

#include <evmc/evmc.hpp>

#include <cstdint>
#include <ostream>

namespace zkwasm {
    namespace bus_mapping {

        constexpr std::uint8_t START_OP = 0;
        constexpr std::uint8_t STACK_OP = 1;
        constexpr std::uint8_t MEMORY_OP = 2;
        constexpr std::uint8_t STORAGE_OP = 3;
        constexpr std::uint8_t TRANSIENT_STORAGE_OP = 4;
        constexpr std::uint8_t CALL_CONTEXT_OP = 5;
        constexpr std::uint8_t ACCOUNT_OP = 6;
        constexpr std::uint8_t TX_REFUND_OP = 7;
        constexpr std::uint8_t TX_ACCESS_LIST_ACCOUNT_OP = 8;
        constexpr std::uint8_t TX_ACCESS_LIST_ACCOUNT_STORAGE_OP = 9;
        constexpr std::uint8_t TX_LOG_OP = 10;
        constexpr std::uint8_t TX_RECEIPT_OP = 11;
        constexpr std::uint8_t PADDING_OP = 12;
        constexpr std::uint8_t rw_options_amount = 13;

        const char* operation_tag_name(std::uint8_t tag);

        enum class rw : std::uint8_t { read, write };

        enum class call_context_field : std::uint8_t {
            RwCounterEndOfReversion,
            CallerId,
            TxId,
            Depth,
            CallerAddress,
            CalleeAddress,
            CallDataOffset,
            CallDataLength,
            ReturnDataOffset,
            ReturnDataLength,
            Value,
            IsSuccess,
            IsPersistent,
            IsStatic,
            LastCalleeId,
            LastCalleeReturnDataOffset,
            LastCalleeReturnDataLength,
            IsRoot,
            IsCreate,
            CodeHash,
            ProgramCounter,
            StackPointer,
            GasLeft,
            MemorySize,
            ReversibleWriteCounter,
        };

        const char* call_context_field_name(call_context_field field);

        enum class account_field : std::uint8_t { Nonce, Balance, CodeHash };

        enum class tx_log_field : std::uint8_t { Address, Topic, Data };

        enum class tx_receipt_field : std::uint8_t { PostStateOrStatus, CumulativeGasUsed, LogLength };

        struct stack_op {
            static constexpr std::uint8_t tag = STACK_OP;
            static constexpr bool reversible = false;

            std::size_t call_id;
            std::uint16_t address;
            word value;
        };

        struct memory_op {
            static constexpr std::uint8_t tag = MEMORY_OP;
            static constexpr bool reversible = false;

            std::size_t call_id;
            std::uint64_t address;
            std::uint8_t value;
        };

        struct storage_op {
            static constexpr std::uint8_t tag = STORAGE_OP;
            static constexpr bool reversible = true;

            evmc::address address;
            word key;
            word value;
            word value_prev;
            std::size_t tx_id;
            word committed_value;

            storage_op reverse() const {
                return {address, key, value_prev, value, tx_id, committed_value};
            }
        };

        struct call_context_op {
            static constexpr std::uint8_t tag = CALL_CONTEXT_OP;
            static constexpr bool reversible = false;

            std::size_t call_id;
            call_context_field field;
            word value;
        };

        struct account_op {
            static constexpr std::uint8_t tag = ACCOUNT_OP;
            static constexpr bool reversible = true;

            evmc::address address;
            account_field field;
            word value;
            word value_prev;

            account_op reverse() const {
                return {address, field, value_prev, value};
            }
        };

        struct tx_refund_op {
            static constexpr std::uint8_t tag = TX_REFUND_OP;
            static constexpr bool reversible = true;

            std::size_t tx_id;
            std::uint64_t value;
            std::uint64_t value_prev;

            tx_refund_op reverse() const {
                return {tx_id, value_prev, value};
            }
        };

        struct tx_access_list_account_op {
            static constexpr std::uint8_t tag = TX_ACCESS_LIST_ACCOUNT_OP;
            static constexpr bool reversible = true;

            std::size_t tx_id;
            evmc::address address;
            bool is_warm;
            bool is_warm_prev;

            tx_access_list_account_op reverse() const {
                return {tx_id, address, is_warm_prev, is_warm};
            }
        };

        struct tx_access_list_account_storage_op {
            static constexpr std::uint8_t tag = TX_ACCESS_LIST_ACCOUNT_STORAGE_OP;
            static constexpr bool reversible = true;

            std::size_t tx_id;
            evmc::address address;
            word key;
            bool is_warm;
            bool is_warm_prev;

            tx_access_list_account_storage_op reverse() const {
                return {tx_id, address, key, is_warm_prev, is_warm};
            }
        };

        struct tx_log_op {
            static constexpr std::uint8_t tag = TX_LOG_OP;
            static constexpr bool reversible = false;

            std::size_t tx_id;
            std::size_t log_id;
            tx_log_field field;
            std::size_t index;
            word value;
        };

        struct tx_receipt_op {
            static constexpr std::uint8_t tag = TX_RECEIPT_OP;
            static constexpr bool reversible = false;

            std::size_t tx_id;
            tx_receipt_field field;
            std::uint64_t value;
        };

        /// One read or write together with the global counter value it was
        /// created at.
        template<typename Op>
        struct operation {
            std::size_t rwc;
            bus_mapping::rw rw;
            bool reversible;
            Op op;

            bool is_write() const {
                return rw == bus_mapping::rw::write;
            }

            bool is_read() const {
                return rw == bus_mapping::rw::read;
            }
        };

        std::ostream& operator<<(std::ostream& os, const stack_op& op);
        std::ostream& operator<<(std::ostream& os, const memory_op& op);
        std::ostream& operator<<(std::ostream& os, const storage_op& op);
        std::ostream& operator<<(std::ostream& os, const call_context_op& op);
        std::ostream& operator<<(std::ostream& os, const account_op& op);
        std::ostream& operator<<(std::ostream& os, const tx_refund_op& op);
        std::ostream& operator<<(std::ostream& os, const tx_access_list_account_op& op);
        std::ostream& operator<<(std::ostream& os, const tx_access_list_account_storage_op& op);
        std::ostream& operator<<(std::ostream& os, const tx_log_op& op);
        std::ostream& operator<<(std::ostream& os, const tx_receipt_op& op);

        // For testing purposes
        template<typename Op>
        std::ostream& operator<<(std::ostream& os, const operation<Op>& obj) {
            os << operation_tag_name(Op::tag) << ": " << obj.rwc << (obj.is_write() ? " W " : " R ") << obj.op;
            return os;
        }

    }    // namespace bus_mapping
}    // namespace zkwasm

#endif    // ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_OPERATION_HPP_
