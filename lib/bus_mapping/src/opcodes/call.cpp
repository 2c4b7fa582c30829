//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#include <zkwasm/bus_mapping/opcodes.hpp>

#include <array>

namespace zkwasm {
    namespace bus_mapping {

        namespace {
            constexpr std::size_t CALL_STACK_ITEMS = 7;
            constexpr std::size_t MAX_CALL_DEPTH = 1024;
        }    // namespace

        void transfer_value(circuit_input_state_ref& state, exec_step& step, const evmc::address& sender,
                            const evmc::address& receiver, const word& value) {
            const word sender_balance = state.sdb.get_account(sender).balance;
            if (sender_balance < value) {
                throw malformed_trace("transfer of " + value.to_string() + " exceeds the sender balance " +
                                      sender_balance.to_string());
            }
            state.push_op_reversible(
                step, account_op{sender, account_field::Balance, sender_balance - value, sender_balance});
            const word receiver_balance = state.sdb.get_account(receiver).balance;
            state.push_op_reversible(
                step, account_op{receiver, account_field::Balance, receiver_balance + value, receiver_balance});
        }

        exec_step gen_call_ops(circuit_input_state_ref& state, const step_window& window) {
            const auto& geth_step = window.current();
            auto exec_step = state.new_step(geth_step);

            // gas, address, value, args_offset, args_length, ret_offset, ret_length
            std::array<word, CALL_STACK_ITEMS> args;
            for (std::size_t i = 0; i < CALL_STACK_ITEMS; ++i) {
                args[i] = geth_step.stack.nth_last(i);
                state.stack_read(exec_step, geth_step.stack.nth_last_filled(i), args[i]);
            }
            const evmc::address callee_address = args[1].to_address();
            const word value = args[2];
            const std::uint64_t args_offset = to_offset(args[3]);
            const std::uint64_t args_length = to_offset(args[4]);
            const std::uint64_t ret_offset = to_offset(args[5]);
            const std::uint64_t ret_length = to_offset(args[6]);

            const call caller = state.current_call();
            {
                auto& ctx = state.current_context();
                for (const auto field : {call_context_field::TxId,
                                         call_context_field::RwCounterEndOfReversion,
                                         call_context_field::IsPersistent,
                                         call_context_field::IsStatic,
                                         call_context_field::Depth,
                                         call_context_field::CalleeAddress}) {
                    state.call_context_read(exec_step, ctx, field);
                }
            }
            if (caller.is_static && !value.is_zero()) {
                throw malformed_trace("value transfer in a static call");
            }

            const bool is_warm = state.sdb.check_account_in_access_list(callee_address);
            state.push_op_reversible(exec_step,
                                     tx_access_list_account_op{state.tx_ctx.id(), callee_address, true, is_warm});

            const bool exists = state.sdb.account_exists(callee_address);
            const evmc::bytes32 code_hash =
                exists ? state.sdb.get_account(callee_address).code_hash : evmc::bytes32{};
            state.account_read(exec_step, callee_address, account_field::CodeHash, word(code_hash));

            const std::size_t callee_index = state.tx.calls.size();
            const bool is_success = state.tx_ctx.call_success(callee_index);
            // A call the caller cannot afford, or one past the depth limit,
            // fails before the callee runs.
            const bool insufficient_balance = state.sdb.get_account(caller.address).balance < value;
            const bool is_precheck_ok = !insufficient_balance && caller.depth <= MAX_CALL_DEPTH;
            if (!is_precheck_ok && is_success) {
                throw malformed_trace("CALL reported successful although its precheck fails");
            }
            state.stack_write(exec_step, geth_step.stack.nth_last_filled(CALL_STACK_ITEMS - 1), word(is_success));

            state.extend_memory(args_offset, args_length);
            state.extend_memory(ret_offset, ret_length);
            {
                auto& ctx = state.current_context();
                const std::array<std::pair<call_context_field, word>, 5> saved = {{
                    {call_context_field::ProgramCounter, word(geth_step.pc + 1)},
                    {call_context_field::StackPointer, word(geth_step.stack.nth_last_filled(CALL_STACK_ITEMS - 1))},
                    {call_context_field::GasLeft, word(geth_step.gas - geth_step.gas_cost)},
                    {call_context_field::MemorySize, word(ctx.memory_size())},
                    {call_context_field::ReversibleWriteCounter, word(ctx.reversible_write_counter)},
                }};
                for (const auto& [field, v] : saved) {
                    state.call_context_write(exec_step, ctx, field, v);
                }
            }

            bytes call_data = state.peek_memory(args_offset, args_length);

            call callee;
            callee.caller_id = caller.call_id;
            callee.is_root = false;
            callee.is_static = caller.is_static;
            callee.caller_address = caller.address;
            callee.address = callee_address;
            callee.code_hash = code_hash;
            callee.value = value;
            callee.depth = caller.depth + 1;
            callee.call_data_offset = args_offset;
            callee.call_data_length = args_length;
            callee.return_data_offset = ret_offset;
            callee.return_data_length = ret_length;
            state.push_call(std::move(callee), std::move(call_data));

            auto& callee_ctx = state.current_context();
            for (const auto field : {call_context_field::CallerId,
                                     call_context_field::TxId,
                                     call_context_field::Depth,
                                     call_context_field::CallerAddress,
                                     call_context_field::CalleeAddress,
                                     call_context_field::CallDataOffset,
                                     call_context_field::CallDataLength,
                                     call_context_field::ReturnDataOffset,
                                     call_context_field::ReturnDataLength,
                                     call_context_field::IsSuccess,
                                     call_context_field::IsPersistent,
                                     call_context_field::IsStatic,
                                     call_context_field::RwCounterEndOfReversion,
                                     call_context_field::IsRoot}) {
                state.call_context_write(exec_step, callee_ctx, field, state.call_context_value(callee_ctx, field));
            }

            if (is_precheck_ok && !value.is_zero()) {
                transfer_value(state, exec_step, caller.address, callee_address, value);
            }

            // A callee without code, or one that never started, returns within
            // the CALL step.
            if (!is_precheck_ok || !window.has_next() || window.next().depth <= geth_step.depth) {
                state.handle_return(exec_step);
            }

            return exec_step;
        }

    }    // namespace bus_mapping
}    // namespace zkwasm
