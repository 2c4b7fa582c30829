//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#include <zkwasm/bus_mapping/opcodes.hpp>

#include <algorithm>
#include <sstream>
#include <string>

namespace zkwasm {
    namespace bus_mapping {

        std::uint64_t to_offset(const word& value) {
            if (!value.is_uint64()) {
                std::stringstream ss;
                ss << "memory operand " << value << " does not fit 64 bits";
                throw out_of_range_access(ss.str());
            }
            return value.to_uint64();
        }

        exec_step gen_associated_ops(opcode_id op, circuit_input_state_ref& state, const step_window& window) {
            if (is_terminal(op)) {
                return gen_return_revert_ops(state, window);
            }
            switch (op) {
                case OP_I32_CONST:
                case OP_I64_CONST:
                    return gen_const_ops(state, window);
                case OP_DROP:
                    return gen_drop_ops(state, window);
                case OP_I32_EQZ:
                case OP_I64_EQZ:
                    return gen_eqz_ops(state, window);
                case OP_I32_ADD:
                case OP_I32_SUB:
                case OP_I32_MUL:
                case OP_I32_AND:
                case OP_I32_OR:
                case OP_I32_XOR:
                case OP_I64_ADD:
                case OP_I64_SUB:
                case OP_I64_MUL:
                case OP_I64_AND:
                case OP_I64_OR:
                case OP_I64_XOR:
                    return gen_binary_ops(state, window);
                case OP_SHA3:
                    return gen_sha3_ops(state, window);
                case OP_CALLDATALOAD:
                    return gen_calldataload_ops(state, window);
                case OP_EXTCODESIZE:
                    return gen_extcodesize_ops(state, window);
                case OP_SLOAD:
                    return gen_sload_ops(state, window);
                case OP_SSTORE:
                    return gen_sstore_ops(state, window);
                case OP_CALL:
                    return gen_call_ops(state, window);
                default:
                    break;
            }
            std::stringstream ss;
            ss << "opcode " << op << " (0x" << std::hex << static_cast<unsigned>(op) << ") is not supported";
            throw bus_mapping_error(error_kind::unsupported_opcode, ss.str());
        }

        void check_lookahead_memory(const step_window& window, std::uint64_t address, const bytes& expected) {
            const auto& next = window.lookahead();
            if (next.memory.empty()) {
                throw malformed_trace("lookahead step carries no memory for the bytes written at " +
                                      std::to_string(address));
            }
            if (address > next.memory.size() || expected.size() > next.memory.size() - address) {
                throw malformed_trace("lookahead memory of " + std::to_string(next.memory.size()) +
                                      " bytes does not cover the written range at " + std::to_string(address));
            }
            if (!std::equal(expected.begin(), expected.end(), next.memory.begin() + address)) {
                throw malformed_trace("lookahead memory disagrees with the written bytes at " +
                                      std::to_string(address));
            }
        }

    }    // namespace bus_mapping
}    // namespace zkwasm
