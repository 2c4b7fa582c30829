//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#ifndef ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_OPCODES_HPP_
#define ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_OPCODES_HPP_

#include <zkwasm/bus_mapping/exec_step.hpp>
#include <zkwasm/bus_mapping/opcode.hpp>
#include <zkwasm/bus_mapping/state_ref.hpp>
#include <zkwasm/bus_mapping/trace.hpp>

namespace zkwasm {
    namespace bus_mapping {

        constexpr std::size_t CODESIZE_BYTE_LENGTH = 4;
        constexpr std::size_t CALLDATA_CHUNK_BYTE_LENGTH = 32;
        constexpr std::size_t KEY_BYTE_LENGTH = 32;
        constexpr std::size_t VALUE_BYTE_LENGTH = 32;

        /// Memory offset or length operand, out_of_range_access when it does
        /// not fit 64 bits.
        std::uint64_t to_offset(const word& value);

        /// Builds the step of the instruction at the window's current
        /// position. Throws unsupported_opcode for instructions outside the
        /// handled set.
        exec_step gen_associated_ops(opcode_id op, circuit_input_state_ref& state, const step_window& window);

        /// Step of an instruction the interpreter reported as failed. The
        /// failing frame completes within it.
        exec_step gen_error_ops(circuit_input_state_ref& state, const step_window& window);

        exec_step gen_begin_tx_ops(circuit_input_state_ref& state);
        exec_step gen_end_tx_ops(circuit_input_state_ref& state, const exec_trace& trace);

        // Per family handlers.
        exec_step gen_const_ops(circuit_input_state_ref& state, const step_window& window);
        exec_step gen_drop_ops(circuit_input_state_ref& state, const step_window& window);
        exec_step gen_eqz_ops(circuit_input_state_ref& state, const step_window& window);
        exec_step gen_binary_ops(circuit_input_state_ref& state, const step_window& window);
        exec_step gen_sha3_ops(circuit_input_state_ref& state, const step_window& window);
        exec_step gen_calldataload_ops(circuit_input_state_ref& state, const step_window& window);
        exec_step gen_extcodesize_ops(circuit_input_state_ref& state, const step_window& window);
        exec_step gen_sload_ops(circuit_input_state_ref& state, const step_window& window);
        exec_step gen_sstore_ops(circuit_input_state_ref& state, const step_window& window);
        exec_step gen_call_ops(circuit_input_state_ref& state, const step_window& window);
        exec_step gen_return_revert_ops(circuit_input_state_ref& state, const step_window& window);

        /// Call context operations shared by every frame completion. The
        /// return window is recorded in the caller as the last callee's.
        void gen_restore_context_ops(circuit_input_state_ref& state, exec_step& step, std::uint64_t return_offset,
                                     std::uint64_t return_length);

        /// Two reversible balance writes moving `value` from `sender` to
        /// `receiver`, recorded in the current frame.
        void transfer_value(circuit_input_state_ref& state, exec_step& step, const evmc::address& sender,
                            const evmc::address& receiver, const word& value);

        /// Checks the bytes the step wrote at `address` against the lookahead
        /// memory, malformed_trace when the lookahead is missing, in another
        /// frame or without memory.
        void check_lookahead_memory(const step_window& window, std::uint64_t address, const bytes& expected);

    }    // namespace bus_mapping
}    // namespace zkwasm

#endif    // ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_OPCODES_HPP_
