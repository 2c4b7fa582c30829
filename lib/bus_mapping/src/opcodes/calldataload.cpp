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

        exec_step gen_calldataload_ops(circuit_input_state_ref& state, const step_window& window) {
            const auto& geth_step = window.current();
            auto exec_step = state.new_step(geth_step);

            const word index = geth_step.stack.nth_last(1);
            state.stack_read(exec_step, geth_step.stack.nth_last_filled(1), index);

            const call c = state.current_call();
            auto& ctx = state.current_context();
            if (c.is_root) {
                state.call_context_read(exec_step, ctx, call_context_field::TxId);
                state.call_context_read(exec_step, ctx, call_context_field::CallDataLength);
            } else {
                state.call_context_read(exec_step, ctx, call_context_field::CallerId);
                state.call_context_read(exec_step, ctx, call_context_field::CallDataLength);
                state.call_context_read(exec_step, ctx, call_context_field::CallDataOffset);
            }

            // Bytes past the end of the call data read as zero.
            std::array<std::uint8_t, CALLDATA_CHUNK_BYTE_LENGTH> chunk{};
            if (index.is_uint64()) {
                const std::uint64_t start = index.to_uint64();
                for (std::size_t i = 0; i < CALLDATA_CHUNK_BYTE_LENGTH; ++i) {
                    const std::uint64_t pos = start + i;
                    if (pos < start || pos >= c.call_data_length) {
                        break;
                    }
                    if (c.is_root) {
                        chunk[i] = ctx.call_data[pos];
                    } else {
                        // caller id as call_id
                        chunk[i] = state.caller_memory_read(exec_step, c.call_data_offset + pos);
                    }
                }
            }

            // Read dest offset
            const word dest_offset = geth_step.stack.nth_last(0);
            state.stack_read(exec_step, geth_step.stack.nth_last_filled(0), dest_offset);
            const std::uint64_t dst = to_offset(dest_offset);

            // Copy result to memory
            state.extend_memory(dst, CALLDATA_CHUNK_BYTE_LENGTH);
            state.memory_write_n(exec_step, dst, chunk.data(), chunk.size());
            check_lookahead_memory(window, dst, bytes(chunk.begin(), chunk.end()));

            return exec_step;
        }

    }    // namespace bus_mapping
}    // namespace zkwasm
