//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#include <zkwasm/bus_mapping/operation.hpp>

namespace zkwasm {
    namespace bus_mapping {

        const char* operation_tag_name(std::uint8_t tag) {
            switch (tag) {
                case START_OP: return "START";
                case STACK_OP: return "STACK";
                case MEMORY_OP: return "MEMORY";
                case STORAGE_OP: return "STORAGE";
                case TRANSIENT_STORAGE_OP: return "TRANSIENT_STORAGE";
                case CALL_CONTEXT_OP: return "CALL_CONTEXT_OP";
                case ACCOUNT_OP: return "ACCOUNT_OP";
                case TX_REFUND_OP: return "TX_REFUND_OP";
                case TX_ACCESS_LIST_ACCOUNT_OP: return "TX_ACCESS_LIST_ACCOUNT_OP";
                case TX_ACCESS_LIST_ACCOUNT_STORAGE_OP: return "TX_ACCESS_LIST_ACCOUNT_STORAGE_OP";
                case TX_LOG_OP: return "TX_LOG_OP";
                case TX_RECEIPT_OP: return "TX_RECEIPT_OP";
                case PADDING_OP: return "PADDING_OP";
                default: return "UNKNOWN_OP";
            }
        }

        const char* call_context_field_name(call_context_field field) {
            switch (field) {
                case call_context_field::RwCounterEndOfReversion: return "RwCounterEndOfReversion";
                case call_context_field::CallerId: return "CallerId";
                case call_context_field::TxId: return "TxId";
                case call_context_field::Depth: return "Depth";
                case call_context_field::CallerAddress: return "CallerAddress";
                case call_context_field::CalleeAddress: return "CalleeAddress";
                case call_context_field::CallDataOffset: return "CallDataOffset";
                case call_context_field::CallDataLength: return "CallDataLength";
                case call_context_field::ReturnDataOffset: return "ReturnDataOffset";
                case call_context_field::ReturnDataLength: return "ReturnDataLength";
                case call_context_field::Value: return "Value";
                case call_context_field::IsSuccess: return "IsSuccess";
                case call_context_field::IsPersistent: return "IsPersistent";
                case call_context_field::IsStatic: return "IsStatic";
                case call_context_field::LastCalleeId: return "LastCalleeId";
                case call_context_field::LastCalleeReturnDataOffset: return "LastCalleeReturnDataOffset";
                case call_context_field::LastCalleeReturnDataLength: return "LastCalleeReturnDataLength";
                case call_context_field::IsRoot: return "IsRoot";
                case call_context_field::IsCreate: return "IsCreate";
                case call_context_field::CodeHash: return "CodeHash";
                case call_context_field::ProgramCounter: return "ProgramCounter";
                case call_context_field::StackPointer: return "StackPointer";
                case call_context_field::GasLeft: return "GasLeft";
                case call_context_field::MemorySize: return "MemorySize";
                case call_context_field::ReversibleWriteCounter: return "ReversibleWriteCounter";
            }
            return "Unknown";
        }

        std::ostream& operator<<(std::ostream& os, const stack_op& op) {
            os << "call " << op.call_id << " addr = " << op.address << " [" << op.value << "]";
            return os;
        }

        std::ostream& operator<<(std::ostream& os, const memory_op& op) {
            os << "call " << op.call_id << " addr = 0x" << std::hex << op.address << " [0x"
               << static_cast<unsigned>(op.value) << "]" << std::dec;
            return os;
        }

        std::ostream& operator<<(std::ostream& os, const storage_op& op) {
            os << "tx " << op.tx_id << " addr = " << word(op.address) << " storage_key = " << op.key << " ["
               << op.value_prev << "] => [" << op.value << "] committed " << op.committed_value;
            return os;
        }

        std::ostream& operator<<(std::ostream& os, const call_context_op& op) {
            os << "call " << op.call_id << " " << call_context_field_name(op.field) << " [" << op.value << "]";
            return os;
        }

        std::ostream& operator<<(std::ostream& os, const account_op& op) {
            os << "addr = " << word(op.address) << " field " << static_cast<unsigned>(op.field) << " ["
               << op.value_prev << "] => [" << op.value << "]";
            return os;
        }

        std::ostream& operator<<(std::ostream& os, const tx_refund_op& op) {
            os << "tx " << op.tx_id << " [" << op.value_prev << "] => [" << op.value << "]";
            return os;
        }

        std::ostream& operator<<(std::ostream& os, const tx_access_list_account_op& op) {
            os << "tx " << op.tx_id << " addr = " << word(op.address) << " [" << op.is_warm_prev << "] => ["
               << op.is_warm << "]";
            return os;
        }

        std::ostream& operator<<(std::ostream& os, const tx_access_list_account_storage_op& op) {
            os << "tx " << op.tx_id << " addr = " << word(op.address) << " storage_key = " << op.key << " ["
               << op.is_warm_prev << "] => [" << op.is_warm << "]";
            return os;
        }

        std::ostream& operator<<(std::ostream& os, const tx_log_op& op) {
            os << "tx " << op.tx_id << " log " << op.log_id << " field " << static_cast<unsigned>(op.field)
               << " index " << op.index << " [" << op.value << "]";
            return os;
        }

        std::ostream& operator<<(std::ostream& os, const tx_receipt_op& op) {
            os << "tx " << op.tx_id << " field " << static_cast<unsigned>(op.field) << " [" << op.value << "]";
            return os;
        }

    }    // namespace bus_mapping
}    // namespace zkwasm
