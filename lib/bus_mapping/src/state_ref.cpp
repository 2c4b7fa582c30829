//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#include <zkwasm/bus_mapping/state_ref.hpp>

#include <boost/log/trivial.hpp>

#include <string>
#include <utility>

namespace zkwasm {
    namespace bus_mapping {

        exec_step circuit_input_state_ref::new_step(const trace_step& step) const {
            const auto& ctx = tx_ctx.current();
            exec_step res;
            res.state = exec_state::from_opcode(step.op);
            res.call_index = ctx.index;
            res.rwc = block_ctx.rwc;
            res.pc = step.pc;
            res.stack_size = step.stack.size();
            res.gas_left = step.gas;
            res.gas_cost = step.gas_cost;
            res.memory_size = ctx.memory_size();
            res.reversible_write_counter = ctx.reversible_write_counter;
            res.error = step.error;
            return res;
        }

        exec_step circuit_input_state_ref::new_begin_tx_step() const {
            exec_step res;
            res.state = exec_state::begin_tx();
            res.call_index = tx.calls.size();
            res.rwc = block_ctx.rwc;
            res.gas_left = tx.data.gas;
            return res;
        }

        exec_step circuit_input_state_ref::new_end_tx_step() const {
            if (tx.calls.empty()) {
                throw internal_error("transaction " + std::to_string(tx.id) + " ends without a root call");
            }
            exec_step res;
            res.state = exec_state::end_tx();
            res.call_index = 0;
            res.rwc = block_ctx.rwc;
            res.reversible_write_counter = tx.calls[0].reversible_write_counter;
            return res;
        }

        call& circuit_input_state_ref::current_call() {
            return tx.calls[tx_ctx.current().index];
        }

        call_context& circuit_input_state_ref::current_context() {
            return tx_ctx.current();
        }

        call& circuit_input_state_ref::caller_call() {
            return tx.calls[tx_ctx.caller().index];
        }

        call_context& circuit_input_state_ref::caller_context() {
            return tx_ctx.caller();
        }

        void circuit_input_state_ref::stack_read(exec_step& step, std::uint16_t address, const word& value) {
            if (address >= STACK_CAPACITY) {
                throw out_of_range_access("stack address " + std::to_string(address) + " out of range");
            }
            push_op(step, rw::read, stack_op{current_call().call_id, address, value});
        }

        void circuit_input_state_ref::stack_write(exec_step& step, std::uint16_t address, const word& value) {
            if (address >= STACK_CAPACITY) {
                throw out_of_range_access("stack address " + std::to_string(address) + " out of range");
            }
            push_op(step, rw::write, stack_op{current_call().call_id, address, value});
        }

        void circuit_input_state_ref::check_memory_address(const call_context& ctx, std::uint64_t address) const {
            if (address >= config.max_memory_size) {
                throw out_of_range_access("memory address " + std::to_string(address) + " beyond the memory limit");
            }
            if (address >= ctx.memory_size()) {
                throw out_of_range_access("memory address " + std::to_string(address) +
                                          " beyond the memory size " + std::to_string(ctx.memory_size()));
            }
        }

        std::uint8_t circuit_input_state_ref::memory_read(exec_step& step, std::uint64_t address) {
            const auto& ctx = current_context();
            check_memory_address(ctx, address);
            const std::uint8_t value = ctx.memory[address];
            push_op(step, rw::read, memory_op{current_call().call_id, address, value});
            return value;
        }

        bytes circuit_input_state_ref::memory_read_n(exec_step& step, std::uint64_t address, std::size_t length) {
            bytes res;
            res.reserve(length);
            for (std::size_t i = 0; i < length; ++i) {
                res.push_back(memory_read(step, address + i));
            }
            return res;
        }

        void circuit_input_state_ref::memory_write(exec_step& step, std::uint64_t address, std::uint8_t value) {
            auto& ctx = current_context();
            check_memory_address(ctx, address);
            ctx.memory[address] = value;
            push_op(step, rw::write, memory_op{current_call().call_id, address, value});
        }

        void circuit_input_state_ref::memory_write_n(exec_step& step, std::uint64_t address, const std::uint8_t* data,
                                                     std::size_t length) {
            for (std::size_t i = 0; i < length; ++i) {
                memory_write(step, address + i, data[i]);
            }
        }

        bytes circuit_input_state_ref::peek_memory(std::uint64_t address, std::size_t length) {
            const auto& ctx = current_context();
            if (length == 0) {
                return {};
            }
            if (length > config.max_memory_size) {
                throw out_of_range_access("memory range of " + std::to_string(length) + " bytes beyond the memory limit");
            }
            check_memory_address(ctx, address);
            check_memory_address(ctx, address + length - 1);
            return bytes(ctx.memory.begin() + address, ctx.memory.begin() + address + length);
        }

        std::uint8_t circuit_input_state_ref::caller_memory_read(exec_step& step, std::uint64_t address) {
            const auto& ctx = caller_context();
            check_memory_address(ctx, address);
            const std::uint8_t value = ctx.memory[address];
            push_op(step, rw::read, memory_op{caller_call().call_id, address, value});
            return value;
        }

        void circuit_input_state_ref::extend_memory(std::uint64_t offset, std::uint64_t length) {
            if (length == 0) {
                return;
            }
            if (offset >= config.max_memory_size || length > config.max_memory_size - offset) {
                throw out_of_range_access("memory range [" + std::to_string(offset) + ", +" +
                                          std::to_string(length) + ") beyond the memory limit");
            }
            const std::uint64_t end = offset + length;
            const std::uint64_t new_size = (end + WORD_BYTE_LENGTH - 1) / WORD_BYTE_LENGTH * WORD_BYTE_LENGTH;
            auto& ctx = current_context();
            if (new_size > ctx.memory.size()) {
                ctx.memory.resize(new_size, 0);
            }
        }

        word circuit_input_state_ref::call_context_value(const call_context& ctx, call_context_field field) {
            const auto it = ctx.fields.find(field);
            if (it != ctx.fields.end()) {
                return it->second;
            }
            const auto& c = tx.calls[ctx.index];
            switch (field) {
                case call_context_field::RwCounterEndOfReversion: return word(c.rw_counter_end_of_reversion);
                case call_context_field::CallerId: return word(c.caller_id);
                case call_context_field::TxId: return word(tx_ctx.id());
                case call_context_field::Depth: return word(c.depth);
                case call_context_field::CallerAddress: return word(c.caller_address);
                case call_context_field::CalleeAddress: return word(c.address);
                case call_context_field::CallDataOffset: return word(c.call_data_offset);
                case call_context_field::CallDataLength: return word(c.call_data_length);
                case call_context_field::ReturnDataOffset: return word(c.return_data_offset);
                case call_context_field::ReturnDataLength: return word(c.return_data_length);
                case call_context_field::Value: return c.value;
                case call_context_field::IsSuccess: return word(c.is_success);
                case call_context_field::IsPersistent: return word(c.is_persistent);
                case call_context_field::IsStatic: return word(c.is_static);
                case call_context_field::IsRoot: return word(c.is_root);
                case call_context_field::IsCreate: return word(0);
                case call_context_field::CodeHash: return word(c.code_hash);
                case call_context_field::ReversibleWriteCounter: return word(ctx.reversible_write_counter);
                case call_context_field::MemorySize: return word(ctx.memory_size());
                default: return word(0);
            }
        }

        word circuit_input_state_ref::call_context_read(exec_step& step, const call_context& ctx,
                                                        call_context_field field) {
            const word value = call_context_value(ctx, field);
            call_context_read(step, tx.calls[ctx.index].call_id, field, value);
            return value;
        }

        void circuit_input_state_ref::call_context_read(exec_step& step, std::size_t call_id,
                                                        call_context_field field, const word& value) {
            push_op(step, rw::read, call_context_op{call_id, field, value});
        }

        void circuit_input_state_ref::call_context_write(exec_step& step, call_context& ctx, call_context_field field,
                                                         const word& value) {
            ctx.fields[field] = value;
            push_op(step, rw::write, call_context_op{tx.calls[ctx.index].call_id, field, value});
        }

        void circuit_input_state_ref::account_read(exec_step& step, const evmc::address& address, account_field field,
                                                   const word& value) {
            push_op(step, rw::read, account_op{address, field, value, value});
        }

        void circuit_input_state_ref::push_copy(exec_step& step, copy_event event) {
            step.copy_rw_counter_delta += event.rw_counter_delta();
            block.copy_events.push_back(std::move(event));
        }

        std::size_t circuit_input_state_ref::push_call(call c, bytes call_data) {
            const std::size_t index = tx.calls.size();
            c.call_id = block_ctx.rwc;
            c.is_success = tx_ctx.call_success(index);
            const bool parent_persistent = tx_ctx.has_call() ? current_call().is_persistent : true;
            c.is_persistent = c.is_success && parent_persistent;
            c.rw_counter_end_of_reversion = c.is_persistent ? 0 : tx_ctx.eor_hint(index);

            BOOST_LOG_TRIVIAL(trace) << "Open call " << index << " id " << c.call_id << " depth " << c.depth
                                     << (c.is_success ? " success" : " failure")
                                     << (c.is_persistent ? " persistent" : "");

            const bool is_success = c.is_success;
            tx.calls.push_back(std::move(c));
            call_context ctx;
            ctx.index = index;
            ctx.call_data = std::move(call_data);
            tx_ctx.push_call(std::move(ctx), is_success);
            return index;
        }

        void circuit_input_state_ref::handle_return(exec_step& step) {
            auto& ctx = tx_ctx.current();
            const std::size_t index = ctx.index;
            const std::size_t count = ctx.reversible_write_counter;
            tx.calls[index].reversible_write_counter = count;

            if (!tx.calls[index].is_success) {
                handle_reversion(step);
            } else if (ctx.group) {
                tx_ctx.add_member(*ctx.group, {index, ctx.group_offset, count});
            }

            tx_ctx.pop_call();
            if (tx.calls[index].is_success && tx_ctx.has_call()) {
                tx_ctx.current().reversible_write_counter += count;
            }
            BOOST_LOG_TRIVIAL(trace) << "Close call " << index << " with " << count << " reversible writes";
        }

        void circuit_input_state_ref::handle_reversion(exec_step& step) {
            const auto group = tx_ctx.take_group();
            const std::size_t total = group.ops.size();
            if (total != tx_ctx.current().reversible_write_counter) {
                throw internal_error("call " + std::to_string(group.owner) + " counted " +
                                     std::to_string(tx_ctx.current().reversible_write_counter) +
                                     " reversible writes, its reversion group holds " + std::to_string(total));
            }

            const std::size_t start = block_ctx.rwc;
            for (auto it = group.ops.rbegin(); it != group.ops.rend(); ++it) {
                push_reversed(step, *it);
            }

            tx_ctx.resolve_eor(group.owner, start);
            for (const auto& member : group.members) {
                tx_ctx.resolve_eor(member.call_index, start + total - member.offset - member.count);
            }
        }

        void circuit_input_state_ref::push_reversed(exec_step& step, const operation_ref& ref) {
            block.container.visit(ref, [this, &step](const auto& forward) {
                using op_type = std::decay_t<decltype(forward.op)>;
                if constexpr (op_type::reversible) {
                    const op_type reversed = forward.op.reverse();
                    // Access list warmth survives the undo.
                    sdb.apply(reversed);
                    push_op(step, rw::write, reversed);
                } else {
                    throw internal_error("operation kind of " + std::to_string(forward.rwc) + " has no reverse");
                }
            });
        }

    }    // namespace bus_mapping
}    // namespace zkwasm
