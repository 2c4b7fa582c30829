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

        exec_step gen_extcodesize_ops(circuit_input_state_ref& state, const step_window& window) {
            const auto& geth_step = window.current();
            auto exec_step = state.new_step(geth_step);

            // Read account address from stack.
            const word address_word = geth_step.stack.nth_last(1);
            state.stack_read(exec_step, geth_step.stack.nth_last_filled(1), address_word);
            const evmc::address address = address_word.to_address();

            // Read transaction ID, rw_counter_end_of_reversion, and is_persistent from call
            // context.
            auto& ctx = state.current_context();
            for (const auto field : {call_context_field::TxId,
                                     call_context_field::RwCounterEndOfReversion,
                                     call_context_field::IsPersistent}) {
                state.call_context_read(exec_step, ctx, field);
            }

            // Update transaction access list for account address.
            const bool is_warm = state.sdb.check_account_in_access_list(address);
            state.push_op_reversible(exec_step, tx_access_list_account_op{state.tx_ctx.id(), address, true, is_warm});

            // Read account code hash and get code length.
            const bool exists = state.sdb.account_exists(address);
            const evmc::bytes32 code_hash = exists ? state.sdb.get_account(address).code_hash : evmc::bytes32{};
            state.account_read(exec_step, address, account_field::CodeHash, word(code_hash));
            std::uint64_t code_size = 0;
            if (exists && code_hash != EMPTY_CODE_HASH) {
                const bytes* code = state.cdb.get(code_hash);
                if (code == nullptr) {
                    throw malformed_trace("no code for the code hash of account " + word(address).to_string());
                }
                code_size = code->size();
            }

            // Read dest offset
            const word dest_offset = geth_step.stack.nth_last(0);
            state.stack_read(exec_step, geth_step.stack.nth_last_filled(0), dest_offset);
            const std::uint64_t dst = to_offset(dest_offset);

            // Write the EXTCODESIZE result to memory, big endian.
            std::array<std::uint8_t, CODESIZE_BYTE_LENGTH> codesize_bytes;
            for (std::size_t i = 0; i < CODESIZE_BYTE_LENGTH; ++i) {
                codesize_bytes[i] = static_cast<std::uint8_t>(code_size >> (8 * (CODESIZE_BYTE_LENGTH - 1 - i)));
            }
            state.extend_memory(dst, CODESIZE_BYTE_LENGTH);
            state.memory_write_n(exec_step, dst, codesize_bytes.data(), codesize_bytes.size());
            check_lookahead_memory(window, dst, bytes(codesize_bytes.begin(), codesize_bytes.end()));

            return exec_step;
        }

    }    // namespace bus_mapping
}    // namespace zkwasm
