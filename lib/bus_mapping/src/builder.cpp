//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#include <zkwasm/bus_mapping/builder.hpp>
#include <zkwasm/bus_mapping/opcodes.hpp>
#include <zkwasm/bus_mapping/state_ref.hpp>
#include <zkwasm/bus_mapping/tx_context.hpp>

#include <boost/log/trivial.hpp>

#include <string>

namespace zkwasm {
    namespace bus_mapping {

        circuit_input_builder::circuit_input_builder(state_db sdb, code_db cdb, builder_config config) :
            m_sdb(std::move(sdb)), m_cdb(std::move(cdb)), m_config(config) {
        }

        std::vector<bool> circuit_input_builder::calls_success(const exec_trace& trace) {
            std::vector<bool> res {!trace.failed};
            const auto& steps = trace.steps;
            for (std::size_t i = 0; i < steps.size(); ++i) {
                if (steps[i].op != OP_CALL || steps[i].error) {
                    continue;
                }
                std::size_t j = i + 1;
                while (j < steps.size() && steps[j].depth != steps[i].depth) {
                    ++j;
                }
                if (j == steps.size()) {
                    throw malformed_trace("CALL at step " + std::to_string(i) + " never returns to depth " +
                                          std::to_string(steps[i].depth));
                }
                res.push_back(!steps[j].stack.last().is_zero());
            }
            return res;
        }

        void circuit_input_builder::handle_block(const std::vector<std::pair<transaction_data, exec_trace>>& txs) {
            BOOST_LOG_TRIVIAL(debug) << "Handle block of " << txs.size() << " transactions";
            for (const auto& [data, trace] : txs) {
                handle_tx(data, trace);
            }
        }

        void circuit_input_builder::handle_tx(const transaction_data& data, const exec_trace& trace) {
            const std::size_t tx_id = m_block.txs.size() + 1;
            BOOST_LOG_TRIVIAL(debug) << "Handle transaction " << tx_id << " with " << trace.steps.size()
                                     << " steps from rwc " << m_block_ctx.rwc;
            const auto success = calls_success(trace);

            // Dry run on scratch state to learn where each failing frame's
            // undo operations land.
            std::vector<std::size_t> eor_hints;
            {
                state_db scratch_sdb = m_sdb;
                bus_mapping::block scratch_block;
                block_context scratch_ctx = m_block_ctx;
                eor_hints = build_tx(scratch_sdb, scratch_block, scratch_ctx, tx_id, data, trace, success, {});
            }

            build_tx(m_sdb, m_block, m_block_ctx, tx_id, data, trace, success, std::move(eor_hints));
            BOOST_LOG_TRIVIAL(debug) << "Transaction " << tx_id << " done, next rwc " << m_block_ctx.rwc;
        }

        std::vector<std::size_t> circuit_input_builder::build_tx(state_db& sdb,
                                                                 bus_mapping::block& block,
                                                                 block_context& block_ctx,
                                                                 std::size_t tx_id,
                                                                 const transaction_data& data,
                                                                 const exec_trace& trace,
                                                                 const std::vector<bool>& calls_success,
                                                                 std::vector<std::size_t> eor_hints) {
            transaction tx;
            tx.id = tx_id;
            tx.data = data;
            tx.is_success = !trace.failed;
            tx_context tx_ctx(tx_id, calls_success, std::move(eor_hints));
            circuit_input_state_ref state(sdb, m_cdb, block, block_ctx, tx, tx_ctx, m_config);

            tx.steps.push_back(gen_begin_tx_ops(state));

            for (std::size_t i = 0; i < trace.steps.size(); ++i) {
                const auto& step = trace.steps[i];
                try {
                    if (!tx_ctx.has_call()) {
                        throw malformed_trace("step after the root call completed");
                    }
                    if (step.depth != tx_ctx.call_depth()) {
                        throw malformed_trace("step at depth " + std::to_string(step.depth) + " while " +
                                              std::to_string(tx_ctx.call_depth()) + " frames are open");
                    }
                    if (!step.memory.empty()) {
                        if (step.memory.size() > m_config.max_memory_size) {
                            throw out_of_range_access("trace memory of " + std::to_string(step.memory.size()) +
                                                      " bytes beyond the memory limit");
                        }
                        tx_ctx.current().memory = step.memory;
                    }

                    BOOST_LOG_TRIVIAL(trace) << "Step " << i << " " << step.op << " pc " << step.pc << " rwc "
                                             << block_ctx.rwc;
                    const step_window window(trace.steps, i);
                    if (step.error) {
                        tx.steps.push_back(gen_error_ops(state, window));
                    } else {
                        tx.steps.push_back(gen_associated_ops(step.op, state, window));
                    }
                } catch (bus_mapping_error& e) {
                    e.set_location(i, step.op);
                    BOOST_LOG_TRIVIAL(error) << "Transaction " << tx_id << " step " << i << " " << step.op << ": "
                                             << error_kind_name(e.kind()) << ": " << e.what();
                    throw;
                }
            }

            if (tx_ctx.has_call()) {
                auto e = malformed_trace("trace of transaction " + std::to_string(tx_id) + " ends with " +
                                         std::to_string(tx_ctx.call_depth()) + " open frames");
                if (!trace.steps.empty()) {
                    e.set_location(trace.steps.size() - 1, trace.steps.back().op);
                }
                BOOST_LOG_TRIVIAL(error) << "Transaction " << tx_id << ": " << e.what();
                throw e;
            }

            tx.steps.push_back(gen_end_tx_ops(state, trace));

            std::vector<std::size_t> resolved = tx_ctx.resolved_eor();
            resolved.resize(tx.calls.size(), 0);
            block.txs.push_back(std::move(tx));
            return resolved;
        }

        std::vector<rw_row> circuit_input_builder::rw_table() const {
            return build_rw_table(m_block.container, m_config.max_rws);
        }

    }    // namespace bus_mapping
}    // namespace zkwasm
