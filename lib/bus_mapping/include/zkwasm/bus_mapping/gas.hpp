//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#ifndef ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_GAS_HPP_
#define ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_GAS_HPP_

#include <zkwasm/bus_mapping/word.hpp>

#include <evmc/evmc.h>

#include <cstdint>

namespace zkwasm {
    namespace bus_mapping {

        constexpr std::int64_t SSTORE_SET_GAS = 20000;
        constexpr std::int64_t SSTORE_RESET_GAS = 5000;
        constexpr std::int64_t COLD_SLOAD_COST = 2100;
        constexpr std::int64_t WARM_STORAGE_READ_COST = 100;
        constexpr std::int64_t SSTORE_CLEARS_SCHEDULE = 15000;
        /// Clear refund once EIP-3529 is active.
        constexpr std::int64_t SSTORE_CLEARS_SCHEDULE_REDUCED = 4800;

        /// EIP-2200 classification of a storage update.
        evmc_storage_status storage_status(const word& original, const word& current, const word& value);

        /// Signed change of the refund counter caused by a store of the given
        /// status.
        std::int64_t sstore_refund_delta(evmc_revision rev, evmc_storage_status status);

        /// Refund counter after storing `value` over `current`.
        std::uint64_t sstore_refund(evmc_revision rev, std::uint64_t refund, const word& original,
                                    const word& current, const word& value);

    }    // namespace bus_mapping
}    // namespace zkwasm

#endif    // ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_GAS_HPP_
