//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#ifndef ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_COPY_EVENT_HPP_
#define ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_COPY_EVENT_HPP_

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace zkwasm {
    namespace bus_mapping {

        enum class copy_data_type : std::uint8_t {
            padding,
            bytecode,
            memory,
            tx_calldata,
            tx_log,
            rlc_acc,
        };

        /// A byte-range copy checked by the copy circuit.
        struct copy_event {
            copy_data_type src_type;
            std::size_t src_id;
            std::uint64_t src_addr;
            std::uint64_t src_addr_end;
            copy_data_type dst_type;
            std::size_t dst_id;
            std::uint64_t dst_addr;
            std::optional<std::size_t> log_id;
            std::size_t rw_counter_start;
            /// (value, is_code)
            std::vector<std::pair<std::uint8_t, bool>> bytes;

            /// Counter values the copy consumes: one per byte on each side
            /// backed by memory or a log.
            std::size_t rw_counter_delta() const {
                std::size_t per_byte = 0;
                if (src_type == copy_data_type::memory)
                    ++per_byte;
                if (dst_type == copy_data_type::memory || dst_type == copy_data_type::tx_log)
                    ++per_byte;
                return per_byte * bytes.size();
            }
        };

    }    // namespace bus_mapping
}    // namespace zkwasm

#endif    // ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_COPY_EVENT_HPP_
