//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#ifndef ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_BUILDER_HPP_
#define ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_BUILDER_HPP_

#include <zkwasm/bus_mapping/block.hpp>
#include <zkwasm/bus_mapping/builder_config.hpp>
#include <zkwasm/bus_mapping/rw_table.hpp>
#include <zkwasm/bus_mapping/state_db.hpp>
#include <zkwasm/bus_mapping/trace.hpp>

#include <utility>
#include <vector>

namespace zkwasm {
    namespace bus_mapping {

        /// Turns the execution traces of a block into its witness: the
        /// operations, steps, calls and copy events.
        class circuit_input_builder {
        public:
            circuit_input_builder(state_db sdb, code_db cdb, builder_config config = {});

            void handle_block(const std::vector<std::pair<transaction_data, exec_trace>>& txs);

            /// Appends one transaction to the block.
            void handle_tx(const transaction_data& data, const exec_trace& trace);

            const bus_mapping::block& block() const {
                return m_block;
            }

            /// State after the transactions handled so far.
            const state_db& sdb() const {
                return m_sdb;
            }

            const builder_config& config() const {
                return m_config;
            }

            /// Sorted and padded RW table of the block.
            std::vector<rw_row> rw_table() const;

            /// Success of every call of a trace, in the order the calls open.
            static std::vector<bool> calls_success(const exec_trace& trace);

        private:
            /// Builds a transaction into `block`, returning the end of
            /// reversion resolved for each call.
            std::vector<std::size_t> build_tx(state_db& sdb,
                                              bus_mapping::block& block,
                                              block_context& block_ctx,
                                              std::size_t tx_id,
                                              const transaction_data& data,
                                              const exec_trace& trace,
                                              const std::vector<bool>& calls_success,
                                              std::vector<std::size_t> eor_hints);

            state_db m_sdb;
            code_db m_cdb;
            builder_config m_config;
            bus_mapping::block m_block;
            block_context m_block_ctx;
        };

    }    // namespace bus_mapping
}    // namespace zkwasm

#endif    // ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_BUILDER_HPP_
