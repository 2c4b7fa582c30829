//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#ifndef ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_TRACE_HPP_
#define ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_TRACE_HPP_

#include <zkwasm/bus_mapping/error.hpp>
#include <zkwasm/bus_mapping/opcode.hpp>
#include <zkwasm/bus_mapping/word.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace zkwasm {
    namespace bus_mapping {

        constexpr std::size_t STACK_CAPACITY = 1024;

        /// Stack snapshot of one step, bottom first.
        struct trace_stack {
            std::vector<word> items;

            std::size_t size() const {
                return items.size();
            }

            bool empty() const {
                return items.empty();
            }

            /// Item `n` positions below the top.
            word nth_last(std::size_t n) const {
                if (n >= items.size()) {
                    throw malformed_trace("stack holds " + std::to_string(items.size()) + " items, item " +
                                          std::to_string(n) + " from the top requested");
                }
                return items[items.size() - 1 - n];
            }

            /// Stack address of the item `n` positions below the top.
            std::uint16_t nth_last_filled(std::size_t n) const {
                return static_cast<std::uint16_t>(STACK_CAPACITY - items.size() + n);
            }

            /// Address the next pushed item lands on.
            std::uint16_t next_push_address() const {
                return static_cast<std::uint16_t>(STACK_CAPACITY - items.size() - 1);
            }

            word last() const {
                return nth_last(0);
            }
        };

        /// One instruction as recorded by the interpreter, taken before the
        /// instruction executes.
        struct trace_step {
            std::uint64_t pc = 0;
            opcode_id op = OP_NOP;
            std::uint64_t gas = 0;
            std::uint64_t gas_cost = 0;
            std::uint64_t refund = 0;
            std::size_t depth = 1;
            trace_stack stack;
            bytes memory;
            /// Immediate operands, e.g. the constant of I32Const.
            std::vector<std::uint64_t> params;
            std::optional<std::string> error;
        };

        struct exec_trace {
            std::uint64_t gas = 0;
            bool failed = false;
            bytes return_value;
            std::vector<trace_step> steps;
        };

        /// Current step of a trace together with its lookahead.
        class step_window {
        public:
            step_window(const std::vector<trace_step>& steps, std::size_t index) : m_steps(steps), m_index(index) {}

            const trace_step& current() const {
                return m_steps[m_index];
            }

            bool has_next() const {
                return m_index + 1 < m_steps.size();
            }

            const trace_step& next() const {
                if (!has_next()) {
                    throw malformed_trace("lookahead step missing after step " + std::to_string(m_index));
                }
                return m_steps[m_index + 1];
            }

            /// Next step of the same frame, the one holding the effects of
            /// the current step.
            const trace_step& lookahead() const {
                const auto& res = next();
                if (res.depth != current().depth) {
                    throw malformed_trace("lookahead of step " + std::to_string(m_index) + " is at depth " +
                                          std::to_string(res.depth) + " instead of " +
                                          std::to_string(current().depth));
                }
                return res;
            }

            std::size_t index() const {
                return m_index;
            }

            const std::vector<trace_step>& steps() const {
                return m_steps;
            }

        private:
            const std::vector<trace_step>& m_steps;
            std::size_t m_index;
        };

    }    // namespace bus_mapping
}    // namespace zkwasm

#endif    // ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_TRACE_HPP_
