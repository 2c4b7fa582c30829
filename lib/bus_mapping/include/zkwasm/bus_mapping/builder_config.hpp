//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#ifndef ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_BUILDER_CONFIG_HPP_
#define ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_BUILDER_CONFIG_HPP_

#include <evmc/evmc.h>

#include <cstddef>

namespace zkwasm {
    namespace bus_mapping {

        struct builder_config {
            evmc_revision revision = EVMC_LONDON;
            /// Rows of the RW table, 0 for unbounded.
            std::size_t max_rws = 0;
            /// Memory addresses at or above this bound are rejected.
            std::size_t max_memory_size = std::size_t(1) << 24;
        };

    }    // namespace bus_mapping
}    // namespace zkwasm

#endif    // ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_BUILDER_CONFIG_HPP_
