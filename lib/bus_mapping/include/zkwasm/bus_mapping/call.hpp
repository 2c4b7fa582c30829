//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#ifndef ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_CALL_HPP_
#define ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_CALL_HPP_

#include <zkwasm/bus_mapping/operation.hpp>
#include <zkwasm/bus_mapping/state_db.hpp>
#include <zkwasm/bus_mapping/word.hpp>

#include <evmc/evmc.hpp>

#include <cstdint>
#include <map>
#include <optional>

namespace zkwasm {
    namespace bus_mapping {

        /// One call frame of a transaction as the circuit sees it.
        struct call {
            std::size_t call_id = 0;
            std::size_t caller_id = 0;
            bool is_root = false;
            bool is_static = false;
            bool is_success = true;
            bool is_persistent = true;
            /// Counter value of the first undo operation of this frame, 0 for
            /// persistent frames.
            std::size_t rw_counter_end_of_reversion = 0;
            /// Own reversible writes plus those of successful children, fixed
            /// when the frame completes.
            std::size_t reversible_write_counter = 0;
            evmc::address caller_address{};
            evmc::address address{};
            evmc::bytes32 code_hash = EMPTY_CODE_HASH;
            word value;
            std::size_t depth = 1;
            std::uint64_t call_data_offset = 0;
            std::uint64_t call_data_length = 0;
            std::uint64_t return_data_offset = 0;
            std::uint64_t return_data_length = 0;
        };

        /// Live state of an open frame.
        struct call_context {
            /// Position of the call in the transaction call list.
            std::size_t index = 0;
            bytes memory;
            std::size_t reversible_write_counter = 0;
            bytes call_data;
            bytes return_data;
            /// Reversion group this frame records into and its offset there.
            std::optional<std::size_t> group;
            std::size_t group_offset = 0;
            /// Values written into this frame's call context.
            std::map<call_context_field, word> fields;

            std::size_t memory_size() const {
                return memory.size();
            }
        };

    }    // namespace bus_mapping
}    // namespace zkwasm

#endif    // ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_CALL_HPP_
