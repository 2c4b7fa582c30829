//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#include <zkwasm/bus_mapping/opcodes.hpp>

#include <string>

namespace zkwasm {
    namespace bus_mapping {

        exec_step gen_begin_tx_ops(circuit_input_state_ref& state) {
            auto exec_step = state.new_begin_tx_step();
            const auto& data = state.tx.data;
            if (!data.to) {
                throw bus_mapping_error(error_kind::unsupported_opcode,
                                        "contract creation in transaction " + std::to_string(state.tx.id));
            }
            const evmc::address callee_address = *data.to;

            const bool exists = state.sdb.account_exists(callee_address);
            const evmc::bytes32 code_hash = exists ? state.sdb.get_account(callee_address).code_hash : evmc::bytes32{};

            call root;
            root.is_root = true;
            root.is_static = false;
            root.caller_address = data.from;
            root.address = callee_address;
            root.code_hash = code_hash;
            root.value = data.value;
            root.depth = 1;
            root.call_data_offset = 0;
            root.call_data_length = data.input.size();
            state.push_call(std::move(root), data.input);

            auto& ctx = state.current_context();
            for (const auto field : {call_context_field::TxId,
                                     call_context_field::RwCounterEndOfReversion,
                                     call_context_field::IsPersistent,
                                     call_context_field::IsSuccess,
                                     call_context_field::CallerAddress,
                                     call_context_field::CalleeAddress,
                                     call_context_field::CallDataLength,
                                     call_context_field::CallDataOffset,
                                     call_context_field::IsRoot,
                                     call_context_field::IsStatic,
                                     call_context_field::Depth}) {
                state.call_context_write(exec_step, ctx, field, state.call_context_value(ctx, field));
            }

            // Sender and callee start the transaction warm.
            for (const auto& address : {data.from, callee_address}) {
                const bool is_warm_prev = !state.sdb.add_account_to_access_list(address);
                state.push_op(exec_step, rw::write,
                              tx_access_list_account_op{state.tx_ctx.id(), address, true, is_warm_prev});
            }

            state.account_read(exec_step, callee_address, account_field::CodeHash, word(code_hash));

            if (!data.value.is_zero()) {
                transfer_value(state, exec_step, data.from, callee_address, data.value);
            }

            return exec_step;
        }

        exec_step gen_end_tx_ops(circuit_input_state_ref& state, const exec_trace& trace) {
            auto exec_step = state.new_end_tx_step();
            const auto& root = state.tx.calls[0];
            const std::size_t tx_id = state.tx_ctx.id();

            state.call_context_read(exec_step, root.call_id, call_context_field::TxId, word(tx_id));

            const std::uint64_t refund = state.sdb.refund();
            state.push_op(exec_step, rw::read, tx_refund_op{tx_id, refund, refund});

            state.block_ctx.cumulative_gas_used += trace.gas;
            state.push_op(exec_step, rw::write,
                          tx_receipt_op{tx_id, tx_receipt_field::PostStateOrStatus, root.is_success ? 1u : 0u});
            state.push_op(exec_step, rw::write,
                          tx_receipt_op{tx_id, tx_receipt_field::CumulativeGasUsed, state.block_ctx.cumulative_gas_used});
            state.push_op(exec_step, rw::write, tx_receipt_op{tx_id, tx_receipt_field::LogLength, 0});

            state.sdb.commit_tx();

            return exec_step;
        }

    }    // namespace bus_mapping
}    // namespace zkwasm
