//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#include <zkwasm/bus_mapping/gas.hpp>
#include <zkwasm/bus_mapping/error.hpp>

namespace zkwasm {
    namespace bus_mapping {

        evmc_storage_status storage_status(const word& original, const word& current, const word& value) {
            if (current == value) {
                return EVMC_STORAGE_ASSIGNED;
            }

            if (original == current) {
                if (original.is_zero()) {
                    return EVMC_STORAGE_ADDED;
                }
                if (value.is_zero()) {
                    return EVMC_STORAGE_DELETED;
                }
                return EVMC_STORAGE_MODIFIED;
            }
            // original != current
            if (!original.is_zero()) {
                if (current.is_zero()) {
                    if (original == value) {
                        return EVMC_STORAGE_DELETED_RESTORED;
                    }
                    return EVMC_STORAGE_DELETED_ADDED;
                }
                if (value.is_zero()) {
                    return EVMC_STORAGE_MODIFIED_DELETED;
                }
                if (original == value) {
                    return EVMC_STORAGE_MODIFIED_RESTORED;
                }
                return EVMC_STORAGE_ASSIGNED;
            }
            // original is zero
            if (original == value) {
                return EVMC_STORAGE_ADDED_DELETED;
            }
            return EVMC_STORAGE_ASSIGNED;
        }

        namespace {
            bool is_net_metered(evmc_revision rev) {
                return rev == EVMC_CONSTANTINOPLE || rev >= EVMC_ISTANBUL;
            }

            // Cost of a store that touches an already dirty slot.
            std::int64_t dirty_store_cost(evmc_revision rev) {
                if (rev >= EVMC_BERLIN) {
                    return WARM_STORAGE_READ_COST;
                }
                return rev >= EVMC_ISTANBUL ? 800 : 200;
            }

            std::int64_t reset_cost(evmc_revision rev) {
                return rev >= EVMC_BERLIN ? SSTORE_RESET_GAS - COLD_SLOAD_COST : SSTORE_RESET_GAS;
            }

            std::int64_t clear_refund(evmc_revision rev) {
                return rev >= EVMC_LONDON ? SSTORE_CLEARS_SCHEDULE_REDUCED : SSTORE_CLEARS_SCHEDULE;
            }
        }    // namespace

        std::int64_t sstore_refund_delta(evmc_revision rev, evmc_storage_status status) {
            const std::int64_t clear = clear_refund(rev);
            if (!is_net_metered(rev)) {
                // Only clearing a non-zero slot is refunded.
                switch (status) {
                    case EVMC_STORAGE_DELETED:
                    case EVMC_STORAGE_MODIFIED_DELETED:
                    case EVMC_STORAGE_ADDED_DELETED:
                        return clear;
                    default:
                        return 0;
                }
            }

            const std::int64_t dirty = dirty_store_cost(rev);
            switch (status) {
                case EVMC_STORAGE_DELETED:
                case EVMC_STORAGE_MODIFIED_DELETED:
                    return clear;
                case EVMC_STORAGE_DELETED_ADDED:
                    return -clear;
                case EVMC_STORAGE_DELETED_RESTORED:
                    return reset_cost(rev) - dirty - clear;
                case EVMC_STORAGE_ADDED_DELETED:
                    return SSTORE_SET_GAS - dirty;
                case EVMC_STORAGE_MODIFIED_RESTORED:
                    return reset_cost(rev) - dirty;
                default:
                    return 0;
            }
        }

        std::uint64_t sstore_refund(evmc_revision rev, std::uint64_t refund, const word& original,
                                    const word& current, const word& value) {
            const auto status = storage_status(original, current, value);
            const std::int64_t res = static_cast<std::int64_t>(refund) + sstore_refund_delta(rev, status);
            if (res < 0) {
                throw malformed_trace("refund counter underflow");
            }
            return static_cast<std::uint64_t>(res);
        }

    }    // namespace bus_mapping
}    // namespace zkwasm
