//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#include <zkwasm/bus_mapping/opcodes.hpp>

#include <sstream>

namespace zkwasm {
    namespace bus_mapping {

        void gen_restore_context_ops(circuit_input_state_ref& state, exec_step& step, std::uint64_t return_offset,
                                     std::uint64_t return_length) {
            const call callee = state.current_call();
            auto& callee_ctx = state.current_context();
            if (callee.is_root) {
                state.call_context_read(step, callee_ctx, call_context_field::IsSuccess);
                return;
            }

            state.call_context_read(step, callee_ctx, call_context_field::IsSuccess);
            state.call_context_read(step, callee_ctx, call_context_field::CallerId);

            auto& caller_ctx = state.caller_context();
            for (const auto field : {call_context_field::ProgramCounter,
                                     call_context_field::StackPointer,
                                     call_context_field::GasLeft,
                                     call_context_field::MemorySize,
                                     call_context_field::ReversibleWriteCounter}) {
                state.call_context_read(step, caller_ctx, field);
            }

            state.call_context_write(step, caller_ctx, call_context_field::LastCalleeId, word(callee.call_id));
            state.call_context_write(step, caller_ctx, call_context_field::LastCalleeReturnDataOffset,
                                     word(return_offset));
            state.call_context_write(step, caller_ctx, call_context_field::LastCalleeReturnDataLength,
                                     word(return_length));
        }

        exec_step gen_return_revert_ops(circuit_input_state_ref& state, const step_window& window) {
            const auto& geth_step = window.current();
            auto exec_step = state.new_step(geth_step);

            const bool reverts = geth_step.op == OP_REVERT;
            if (state.current_call().is_success == reverts) {
                std::stringstream ss;
                ss << geth_step.op << " in a call the trace reports as "
                   << (reverts ? "successful" : "failed");
                throw malformed_trace(ss.str());
            }

            std::uint64_t offset = 0;
            std::uint64_t length = 0;
            if (geth_step.op != OP_STOP) {
                const word offset_word = geth_step.stack.nth_last(0);
                state.stack_read(exec_step, geth_step.stack.nth_last_filled(0), offset_word);
                const word length_word = geth_step.stack.nth_last(1);
                state.stack_read(exec_step, geth_step.stack.nth_last_filled(1), length_word);
                offset = to_offset(offset_word);
                length = to_offset(length_word);
                if (length != 0) {
                    state.extend_memory(offset, length);
                }
            }

            gen_restore_context_ops(state, exec_step, offset, length);
            state.handle_return(exec_step);

            return exec_step;
        }

        exec_step gen_error_ops(circuit_input_state_ref& state, const step_window& window) {
            const auto& geth_step = window.current();
            auto exec_step = state.new_step(geth_step);
            exec_step.state = exec_state::error(geth_step.op);

            if (state.current_call().is_success) {
                throw malformed_trace("error \"" + geth_step.error.value_or("") +
                                      "\" in a call the trace reports as successful");
            }

            gen_restore_context_ops(state, exec_step, 0, 0);
            state.handle_return(exec_step);

            return exec_step;
        }

    }    // namespace bus_mapping
}    // namespace zkwasm
