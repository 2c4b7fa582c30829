//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#include <zkwasm/bus_mapping/opcodes.hpp>
#include <zkwasm/bus_mapping/gas.hpp>

#include <string>

namespace zkwasm {
    namespace bus_mapping {

        exec_step gen_sstore_ops(circuit_input_state_ref& state, const step_window& window) {
            const auto& geth_step = window.current();
            auto exec_step = state.new_step(geth_step);

            auto& ctx = state.current_context();
            for (const auto field : {call_context_field::TxId,
                                     call_context_field::IsStatic,
                                     call_context_field::RwCounterEndOfReversion,
                                     call_context_field::IsPersistent,
                                     call_context_field::CalleeAddress}) {
                state.call_context_read(exec_step, ctx, field);
            }
            if (state.current_call().is_static) {
                throw malformed_trace("SSTORE in a static call");
            }
            const evmc::address contract_addr = state.current_call().address;

            const word value_offset = geth_step.stack.nth_last(0);
            state.stack_read(exec_step, geth_step.stack.nth_last_filled(0), value_offset);
            const word key_offset = geth_step.stack.nth_last(1);
            state.stack_read(exec_step, geth_step.stack.nth_last_filled(1), key_offset);

            const std::uint64_t key_addr = to_offset(key_offset);
            const std::uint64_t value_addr = to_offset(value_offset);
            const bytes key_bytes = state.peek_memory(key_addr, KEY_BYTE_LENGTH);
            const bytes value_bytes = state.peek_memory(value_addr, VALUE_BYTE_LENGTH);
            const word key(key_bytes.data(), key_bytes.size());
            const word value(value_bytes.data(), value_bytes.size());

            const bool is_warm = state.sdb.check_account_storage_in_access_list(contract_addr, key);
            const word value_prev = state.sdb.get_storage(contract_addr, key);
            const word committed_value = state.sdb.get_committed_storage(contract_addr, key);

            state.push_op_reversible(
                exec_step, storage_op{contract_addr, key, value, value_prev, state.tx_ctx.id(), committed_value});

            state.push_op_reversible(
                exec_step, tx_access_list_account_storage_op{state.tx_ctx.id(), contract_addr, key, true, is_warm});

            const std::uint64_t refund_prev = state.sdb.refund();
            const std::uint64_t refund =
                sstore_refund(state.config.revision, refund_prev, committed_value, value_prev, value);
            state.push_op_reversible(exec_step, tx_refund_op{state.tx_ctx.id(), refund, refund_prev});
            if (window.lookahead().refund != refund) {
                throw malformed_trace("SSTORE refund " + std::to_string(refund) + ", lookahead holds " +
                                      std::to_string(window.lookahead().refund));
            }

            state.memory_read_n(exec_step, key_addr, KEY_BYTE_LENGTH);
            state.memory_read_n(exec_step, value_addr, VALUE_BYTE_LENGTH);

            return exec_step;
        }

    }    // namespace bus_mapping
}    // namespace zkwasm
