//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#ifndef ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_STATE_REF_HPP_
#define ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_STATE_REF_HPP_

#include <zkwasm/bus_mapping/block.hpp>
#include <zkwasm/bus_mapping/builder_config.hpp>
#include <zkwasm/bus_mapping/call.hpp>
#include <zkwasm/bus_mapping/copy_event.hpp>
#include <zkwasm/bus_mapping/error.hpp>
#include <zkwasm/bus_mapping/exec_step.hpp>
#include <zkwasm/bus_mapping/operation.hpp>
#include <zkwasm/bus_mapping/state_db.hpp>
#include <zkwasm/bus_mapping/trace.hpp>
#include <zkwasm/bus_mapping/tx_context.hpp>

#include <cstdint>
#include <type_traits>

namespace zkwasm {
    namespace bus_mapping {

        /// Exclusive handle on the state of a block build given to the
        /// opcode handlers. Every operation of the block is created here.
        class circuit_input_state_ref {
        public:
            circuit_input_state_ref(state_db& sdb,
                                    code_db& cdb,
                                    bus_mapping::block& block,
                                    block_context& block_ctx,
                                    transaction& tx,
                                    tx_context& tx_ctx,
                                    const builder_config& config) :
                sdb(sdb), cdb(cdb), block(block), block_ctx(block_ctx), tx(tx), tx_ctx(tx_ctx), config(config) {}

            exec_step new_step(const trace_step& step) const;
            exec_step new_begin_tx_step() const;
            exec_step new_end_tx_step() const;

            call& current_call();
            call_context& current_context();
            call& caller_call();
            call_context& caller_context();

            template<typename Op>
            operation_ref push_op(exec_step& step, bus_mapping::rw rw, const Op& op) {
                const auto ref = block.container.insert(operation<Op>{block_ctx.rwc, rw, false, op});
                ++block_ctx.rwc;
                step.bus_mapping_instance.push_back(ref);
                return ref;
            }

            /// Write to state that is undone if an enclosing frame fails. The
            /// effect is applied to the state snapshot immediately.
            template<typename Op>
            operation_ref push_op_reversible(exec_step& step, const Op& op) {
                static_assert(Op::reversible, "operation kind has no reverse");
                if (!tx_ctx.has_call()) {
                    throw internal_error("reversible write outside of a call frame");
                }
                sdb.apply(op);
                const auto ref = block.container.insert(operation<Op>{block_ctx.rwc, bus_mapping::rw::write, true, op});
                ++block_ctx.rwc;
                step.bus_mapping_instance.push_back(ref);
                tx_ctx.record_reversible(ref);
                ++step.reversible_write_counter_delta;
                return ref;
            }

            void stack_read(exec_step& step, std::uint16_t address, const word& value);
            void stack_write(exec_step& step, std::uint16_t address, const word& value);

            std::uint8_t memory_read(exec_step& step, std::uint64_t address);
            bytes memory_read_n(exec_step& step, std::uint64_t address, std::size_t length);
            void memory_write(exec_step& step, std::uint64_t address, std::uint8_t value);
            void memory_write_n(exec_step& step, std::uint64_t address, const std::uint8_t* data, std::size_t length);
            /// Current memory bytes without creating operations.
            bytes peek_memory(std::uint64_t address, std::size_t length);
            /// Reads a byte of the caller's memory.
            std::uint8_t caller_memory_read(exec_step& step, std::uint64_t address);
            /// Grows the current memory to cover [offset, offset + length),
            /// rounded up to whole words.
            void extend_memory(std::uint64_t offset, std::uint64_t length);

            /// Current value of a call context field of an open frame.
            word call_context_value(const call_context& ctx, call_context_field field);
            word call_context_read(exec_step& step, const call_context& ctx, call_context_field field);
            void call_context_read(exec_step& step, std::size_t call_id, call_context_field field, const word& value);
            void call_context_write(exec_step& step, call_context& ctx, call_context_field field, const word& value);

            void account_read(exec_step& step, const evmc::address& address, account_field field, const word& value);

            void push_copy(exec_step& step, copy_event event);

            /// Opens a frame for `c`, which gets its call id, success and
            /// persistence from the builder state. Returns the call index.
            std::size_t push_call(call c, bytes call_data);

            /// Completes the current frame: materializes its reversion group
            /// when it failed and folds its write counter into the caller.
            void handle_return(exec_step& step);

            state_db& sdb;
            code_db& cdb;
            bus_mapping::block& block;
            block_context& block_ctx;
            transaction& tx;
            tx_context& tx_ctx;
            const builder_config& config;

        private:
            void handle_reversion(exec_step& step);
            void push_reversed(exec_step& step, const operation_ref& ref);
            void check_memory_address(const call_context& ctx, std::uint64_t address) const;
        };

    }    // namespace bus_mapping
}    // namespace zkwasm

#endif    // ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_STATE_REF_HPP_
