//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#include <zkwasm/bus_mapping/opcodes.hpp>

namespace zkwasm {
    namespace bus_mapping {

        exec_step gen_sload_ops(circuit_input_state_ref& state, const step_window& window) {
            const auto& geth_step = window.current();
            auto exec_step = state.new_step(geth_step);

            const word dest_offset = geth_step.stack.nth_last(0);
            state.stack_read(exec_step, geth_step.stack.nth_last_filled(0), dest_offset);
            const word key_offset = geth_step.stack.nth_last(1);
            state.stack_read(exec_step, geth_step.stack.nth_last_filled(1), key_offset);

            auto& ctx = state.current_context();
            for (const auto field : {call_context_field::TxId,
                                     call_context_field::RwCounterEndOfReversion,
                                     call_context_field::IsPersistent,
                                     call_context_field::CalleeAddress}) {
                state.call_context_read(exec_step, ctx, field);
            }
            const evmc::address contract_addr = state.current_call().address;

            const bytes key_bytes = state.memory_read_n(exec_step, to_offset(key_offset), KEY_BYTE_LENGTH);
            const word key(key_bytes.data(), key_bytes.size());

            const word value = state.sdb.get_storage(contract_addr, key);
            const word committed_value = state.sdb.get_committed_storage(contract_addr, key);
            state.push_op(exec_step, rw::read,
                          storage_op{contract_addr, key, value, value, state.tx_ctx.id(), committed_value});

            const bool is_warm = state.sdb.check_account_storage_in_access_list(contract_addr, key);
            state.push_op_reversible(
                exec_step, tx_access_list_account_storage_op{state.tx_ctx.id(), contract_addr, key, true, is_warm});

            const std::uint64_t dst = to_offset(dest_offset);
            const auto value_bytes = value.to_be_bytes();
            state.extend_memory(dst, VALUE_BYTE_LENGTH);
            state.memory_write_n(exec_step, dst, value_bytes.data(), value_bytes.size());
            check_lookahead_memory(window, dst, bytes(value_bytes.begin(), value_bytes.end()));

            return exec_step;
        }

    }    // namespace bus_mapping
}    // namespace zkwasm
