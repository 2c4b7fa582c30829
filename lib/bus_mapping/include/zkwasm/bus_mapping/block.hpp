//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#ifndef ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_BLOCK_HPP_
#define ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_BLOCK_HPP_

#include <zkwasm/bus_mapping/call.hpp>
#include <zkwasm/bus_mapping/copy_event.hpp>
#include <zkwasm/bus_mapping/exec_step.hpp>
#include <zkwasm/bus_mapping/operation_container.hpp>
#include <zkwasm/bus_mapping/word.hpp>

#include <evmc/evmc.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace zkwasm {
    namespace bus_mapping {

        struct transaction_data {
            evmc::address from{};
            /// Empty for contract creation, which is not supported.
            std::optional<evmc::address> to;
            word value;
            std::uint64_t gas = 0;
            bytes input;
        };

        struct transaction {
            std::size_t id = 0;
            transaction_data data;
            bool is_success = true;
            std::vector<call> calls;
            std::vector<exec_step> steps;
        };

        struct block {
            std::vector<transaction> txs;
            operation_container container;
            std::vector<copy_event> copy_events;
            std::vector<bytes> sha3_inputs;
        };

        /// Block-wide counters.
        struct block_context {
            std::size_t rwc = 1;
            std::uint64_t cumulative_gas_used = 0;
        };

    }    // namespace bus_mapping
}    // namespace zkwasm

#endif    // ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_BLOCK_HPP_
