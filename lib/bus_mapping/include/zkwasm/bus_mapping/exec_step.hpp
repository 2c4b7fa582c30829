//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#ifndef ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_EXEC_STEP_HPP_
#define ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_EXEC_STEP_HPP_

#include <zkwasm/bus_mapping/opcode.hpp>
#include <zkwasm/bus_mapping/operation_container.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace zkwasm {
    namespace bus_mapping {

        struct exec_state {
            enum class kind : std::uint8_t { op, begin_tx, end_tx, error };

            kind type = kind::op;
            opcode_id opcode = OP_NOP;

            static exec_state from_opcode(opcode_id op) {
                return {kind::op, op};
            }

            static exec_state begin_tx() {
                return {kind::begin_tx, OP_NOP};
            }

            static exec_state end_tx() {
                return {kind::end_tx, OP_NOP};
            }

            static exec_state error(opcode_id op) {
                return {kind::error, op};
            }

            bool operator==(const exec_state& other) const {
                return type == other.type && opcode == other.opcode;
            }
        };

        std::ostream& operator<<(std::ostream& os, const exec_state& state);

        /// Witness of one traced instruction (or of a transaction boundary).
        struct exec_step {
            exec_state state;
            std::size_t call_index = 0;
            /// Counter value at the start of the step.
            std::size_t rwc = 0;
            std::uint64_t pc = 0;
            std::size_t stack_size = 0;
            std::uint64_t gas_left = 0;
            std::uint64_t gas_cost = 0;
            std::size_t memory_size = 0;
            std::size_t reversible_write_counter = 0;
            std::size_t reversible_write_counter_delta = 0;
            std::size_t copy_rw_counter_delta = 0;
            std::optional<std::string> error;
            /// Operations created while building this step, in creation order.
            std::vector<operation_ref> bus_mapping_instance;
        };

    }    // namespace bus_mapping
}    // namespace zkwasm

#endif    // ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_EXEC_STEP_HPP_
