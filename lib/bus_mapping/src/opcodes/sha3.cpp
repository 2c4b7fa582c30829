//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#include <zkwasm/bus_mapping/opcodes.hpp>

#include <ethash/keccak.hpp>

namespace zkwasm {
    namespace bus_mapping {

        exec_step gen_sha3_ops(circuit_input_state_ref& state, const step_window& window) {
            const auto& geth_step = window.current();
            auto exec_step = state.new_step(geth_step);

            // byte offset of the digest in the memory.
            const word dest = geth_step.stack.nth_last(0);
            state.stack_read(exec_step, geth_step.stack.nth_last_filled(0), dest);

            // byte size to read in the memory.
            const word size = geth_step.stack.nth_last(1);
            state.stack_read(exec_step, geth_step.stack.nth_last_filled(1), size);

            // byte offset in the memory.
            const word offset = geth_step.stack.nth_last(2);
            state.stack_read(exec_step, geth_step.stack.nth_last_filled(2), offset);

            const std::uint64_t src = to_offset(offset);
            const std::uint64_t length = to_offset(size);
            const std::uint64_t dst = to_offset(dest);
            state.extend_memory(src, length);

            // Memory read operations
            const std::size_t rw_counter_start = state.block_ctx.rwc;
            const bytes input = state.memory_read_n(exec_step, src, length);

            // keccak-256 hash of the given data in memory.
            const auto sha3 = ethash::keccak256(input.data(), input.size());
            state.extend_memory(dst, WORD_BYTE_LENGTH);
            state.memory_write_n(exec_step, dst, sha3.bytes, WORD_BYTE_LENGTH);
            check_lookahead_memory(window, dst, bytes(sha3.bytes, sha3.bytes + WORD_BYTE_LENGTH));

            std::vector<std::pair<std::uint8_t, bool>> steps;
            steps.reserve(input.size());
            for (const auto byte : input) {
                steps.emplace_back(byte, false);
            }
            state.block.sha3_inputs.push_back(input);

            const std::size_t call_id = state.current_call().call_id;
            state.push_copy(exec_step,
                            copy_event {
                                copy_data_type::memory,
                                call_id,
                                src,
                                src + length,
                                copy_data_type::rlc_acc,
                                call_id,
                                0,
                                std::nullopt,
                                rw_counter_start,
                                std::move(steps)
                            });

            return exec_step;
        }

    }    // namespace bus_mapping
}    // namespace zkwasm
