//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#include <zkwasm/bus_mapping/opcodes.hpp>

#include <limits>
#include <sstream>

namespace zkwasm {
    namespace bus_mapping {

        namespace {
            bool is_i32(opcode_id op) {
                switch (op) {
                    case OP_I32_CONST:
                    case OP_I32_EQZ:
                    case OP_I32_ADD:
                    case OP_I32_SUB:
                    case OP_I32_MUL:
                    case OP_I32_AND:
                    case OP_I32_OR:
                    case OP_I32_XOR:
                        return true;
                    default:
                        return false;
                }
            }

            std::uint64_t wrap(opcode_id op, std::uint64_t value) {
                return is_i32(op) ? (value & std::numeric_limits<std::uint32_t>::max()) : value;
            }

            std::uint64_t operand(opcode_id op, const word& value) {
                if (!value.is_uint64()) {
                    throw malformed_trace("stack operand wider than 64 bits");
                }
                return wrap(op, value.to_uint64());
            }

            // The lookahead top must hold the result.
            void check_lookahead_top(const step_window& window, const word& expected) {
                const auto& next = window.lookahead();
                if (next.stack.empty()) {
                    throw malformed_trace("lookahead stack is empty, " + expected.to_string() + " expected on top");
                }
                if (next.stack.last() != expected) {
                    std::stringstream ss;
                    ss << window.current().op << " computed " << expected << ", lookahead stack holds "
                       << next.stack.last();
                    throw malformed_trace(ss.str());
                }
            }
        }    // namespace

        exec_step gen_const_ops(circuit_input_state_ref& state, const step_window& window) {
            const auto& geth_step = window.current();
            auto exec_step = state.new_step(geth_step);

            if (geth_step.params.empty()) {
                throw malformed_trace("constant instruction without immediate");
            }
            const word value(wrap(geth_step.op, geth_step.params[0]));
            state.stack_write(exec_step, geth_step.stack.next_push_address(), value);
            check_lookahead_top(window, value);

            return exec_step;
        }

        exec_step gen_drop_ops(circuit_input_state_ref& state, const step_window& window) {
            const auto& geth_step = window.current();
            auto exec_step = state.new_step(geth_step);

            state.stack_read(exec_step, geth_step.stack.nth_last_filled(0), geth_step.stack.nth_last(0));

            return exec_step;
        }

        exec_step gen_eqz_ops(circuit_input_state_ref& state, const step_window& window) {
            const auto& geth_step = window.current();
            auto exec_step = state.new_step(geth_step);

            const word a = geth_step.stack.nth_last(0);
            state.stack_read(exec_step, geth_step.stack.nth_last_filled(0), a);

            const word result(operand(geth_step.op, a) == 0 ? 1 : 0);
            state.stack_write(exec_step, geth_step.stack.nth_last_filled(0), result);
            check_lookahead_top(window, result);

            return exec_step;
        }

        exec_step gen_binary_ops(circuit_input_state_ref& state, const step_window& window) {
            const auto& geth_step = window.current();
            auto exec_step = state.new_step(geth_step);
            const auto op = geth_step.op;

            // rhs is on top
            const word rhs = geth_step.stack.nth_last(0);
            state.stack_read(exec_step, geth_step.stack.nth_last_filled(0), rhs);
            const word lhs = geth_step.stack.nth_last(1);
            state.stack_read(exec_step, geth_step.stack.nth_last_filled(1), lhs);

            const std::uint64_t a = operand(op, lhs);
            const std::uint64_t b = operand(op, rhs);
            std::uint64_t res = 0;
            switch (op) {
                case OP_I32_ADD:
                case OP_I64_ADD:
                    res = a + b;
                    break;
                case OP_I32_SUB:
                case OP_I64_SUB:
                    res = a - b;
                    break;
                case OP_I32_MUL:
                case OP_I64_MUL:
                    res = a * b;
                    break;
                case OP_I32_AND:
                case OP_I64_AND:
                    res = a & b;
                    break;
                case OP_I32_OR:
                case OP_I64_OR:
                    res = a | b;
                    break;
                case OP_I32_XOR:
                case OP_I64_XOR:
                    res = a ^ b;
                    break;
                default:
                    throw internal_error("not a binary instruction");
            }
            const word result(wrap(op, res));
            state.stack_write(exec_step, geth_step.stack.nth_last_filled(1), result);
            check_lookahead_top(window, result);

            return exec_step;
        }

    }    // namespace bus_mapping
}    // namespace zkwasm
