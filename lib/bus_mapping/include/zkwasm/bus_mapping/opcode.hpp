//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#ifndef ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_OPCODE_HPP_
#define ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_OPCODE_HPP_

#include <cstdint>
#include <ostream>

namespace zkwasm {
    namespace bus_mapping {

        /// WASM instructions keep their binary encoding, host instructions
        /// borrowed from the EVM live at 0x100 | evm opcode.
        enum opcode_id : std::uint16_t {
            OP_UNREACHABLE = 0x00,
            OP_NOP = 0x01,
            OP_DROP = 0x1a,
            OP_I32_CONST = 0x41,
            OP_I64_CONST = 0x42,
            OP_I32_EQZ = 0x45,
            OP_I64_EQZ = 0x50,
            OP_I32_ADD = 0x6a,
            OP_I32_SUB = 0x6b,
            OP_I32_MUL = 0x6c,
            OP_I32_AND = 0x71,
            OP_I32_OR = 0x72,
            OP_I32_XOR = 0x73,
            OP_I64_ADD = 0x7c,
            OP_I64_SUB = 0x7d,
            OP_I64_MUL = 0x7e,
            OP_I64_AND = 0x83,
            OP_I64_OR = 0x84,
            OP_I64_XOR = 0x85,

            OP_STOP = 0x100,
            OP_SHA3 = 0x120,
            OP_CALLDATALOAD = 0x135,
            OP_EXTCODESIZE = 0x13b,
            OP_SLOAD = 0x154,
            OP_SSTORE = 0x155,
            OP_CALL = 0x1f1,
            OP_RETURN = 0x1f3,
            OP_REVERT = 0x1fd,
        };

        inline const char* opcode_name(opcode_id op) {
            switch (op) {
                case OP_UNREACHABLE: return "Unreachable";
                case OP_NOP: return "Nop";
                case OP_DROP: return "Drop";
                case OP_I32_CONST: return "I32Const";
                case OP_I64_CONST: return "I64Const";
                case OP_I32_EQZ: return "I32Eqz";
                case OP_I64_EQZ: return "I64Eqz";
                case OP_I32_ADD: return "I32Add";
                case OP_I32_SUB: return "I32Sub";
                case OP_I32_MUL: return "I32Mul";
                case OP_I32_AND: return "I32And";
                case OP_I32_OR: return "I32Or";
                case OP_I32_XOR: return "I32Xor";
                case OP_I64_ADD: return "I64Add";
                case OP_I64_SUB: return "I64Sub";
                case OP_I64_MUL: return "I64Mul";
                case OP_I64_AND: return "I64And";
                case OP_I64_OR: return "I64Or";
                case OP_I64_XOR: return "I64Xor";
                case OP_STOP: return "STOP";
                case OP_SHA3: return "SHA3";
                case OP_CALLDATALOAD: return "CALLDATALOAD";
                case OP_EXTCODESIZE: return "EXTCODESIZE";
                case OP_SLOAD: return "SLOAD";
                case OP_SSTORE: return "SSTORE";
                case OP_CALL: return "CALL";
                case OP_RETURN: return "RETURN";
                case OP_REVERT: return "REVERT";
            }
            return "UNKNOWN";
        }

        /// Instructions that end the current call frame.
        inline bool is_terminal(opcode_id op) {
            return op == OP_STOP || op == OP_RETURN || op == OP_REVERT;
        }

        inline std::ostream& operator<<(std::ostream& os, opcode_id op) {
            os << opcode_name(op);
            return os;
        }

    }    // namespace bus_mapping
}    // namespace zkwasm

#endif    // ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_OPCODE_HPP_
