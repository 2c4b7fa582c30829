//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#include <zkwasm/bus_mapping/state_ref.hpp>

#include "mock_trace.hpp"

class StateRefTest : public testing::Test {
public:
    StateRefTest() :
        tx_ctx(1, {true}, {}), state(sdb, cdb, blk, block_ctx, tx, tx_ctx, config) {
        tx.id = 1;
    }

    void open_root_call() {
        call root;
        root.is_root = true;
        root.address = CONTRACT_ADDR;
        state.push_call(std::move(root), {});
    }

    state_db sdb;
    code_db cdb;
    block blk;
    block_context block_ctx;
    transaction tx;
    builder_config config;
    tx_context tx_ctx;
    circuit_input_state_ref state;
};

inline void stack_op_check(const operation<stack_op>& op, std::size_t rwc, bool is_write, std::size_t call_id,
                           std::uint16_t address, const word& value) {
    EXPECT_EQ(op.rwc, rwc);
    EXPECT_EQ(op.is_write(), is_write);
    EXPECT_EQ(op.op.call_id, call_id);
    EXPECT_EQ(op.op.address, address);
    EXPECT_EQ(op.op.value, value);
}

TEST_F(StateRefTest, counter_starts_at_one_without_gaps) {
    open_root_call();
    EXPECT_EQ(state.current_call().call_id, 1);

    exec_step step;
    state.stack_write(step, 1023, word(7));
    state.stack_read(step, 1023, word(7));
    state.call_context_read(step, state.current_context(), call_context_field::TxId);

    EXPECT_EQ(block_ctx.rwc, 4);
    ASSERT_EQ(step.bus_mapping_instance.size(), 3);
    const auto& stack = blk.container.get<stack_op>();
    ASSERT_EQ(stack.size(), 2);
    stack_op_check(stack[0], 1/*rwc*/, true/*is_write*/, 1/*call_id*/, 1023/*address*/, 7/*value*/);
    stack_op_check(stack[1], 2/*rwc*/, false/*is_write*/, 1/*call_id*/, 1023/*address*/, 7/*value*/);
    EXPECT_EQ(blk.container.get<call_context_op>(step.bus_mapping_instance[2]).op.value, word(1));
    EXPECT_EQ(blk.container.sorted_rw_counters(), (std::vector<std::size_t> {1, 2, 3}));
}

TEST_F(StateRefTest, stack_address_out_of_range) {
    open_root_call();
    exec_step step;
    try {
        state.stack_read(step, STACK_CAPACITY, word(0));
        FAIL() << "stack address 1024 accepted";
    } catch (const bus_mapping_error& e) {
        EXPECT_EQ(e.kind(), error_kind::out_of_range_access);
    }
    EXPECT_EQ(block_ctx.rwc, 1);
}

TEST_F(StateRefTest, memory_grows_by_words) {
    open_root_call();
    state.extend_memory(0x10, 0x32);
    EXPECT_EQ(state.current_context().memory_size(), 0x60);
    state.extend_memory(0, 1);
    EXPECT_EQ(state.current_context().memory_size(), 0x60);
    state.extend_memory(0x100, 0);
    EXPECT_EQ(state.current_context().memory_size(), 0x60);

    exec_step step;
    const std::uint8_t data[2] = {0xab, 0xcd};
    state.memory_write_n(step, 0x5e, data, 2);
    EXPECT_EQ(state.memory_read(step, 0x5f), 0xcd);
    EXPECT_THROW(state.memory_read(step, 0x60), bus_mapping_error);
}

TEST_F(StateRefTest, memory_limit) {
    config.max_memory_size = 64;
    open_root_call();
    try {
        state.extend_memory(60, 8);
        FAIL() << "memory extended past the limit";
    } catch (const bus_mapping_error& e) {
        EXPECT_EQ(e.kind(), error_kind::out_of_range_access);
    }
    state.extend_memory(32, 32);
    EXPECT_EQ(state.current_context().memory_size(), 64);
}

TEST_F(StateRefTest, reversible_write_captures_previous_value) {
    open_root_call();
    sdb.set_storage(CONTRACT_ADDR, word(1), word(0x6f));

    exec_step step;
    const word prev = sdb.get_storage(CONTRACT_ADDR, word(1));
    state.push_op_reversible(step, storage_op {CONTRACT_ADDR, word(1), word(0x70), prev, 1, prev});

    EXPECT_EQ(sdb.get_storage(CONTRACT_ADDR, word(1)), word(0x70));
    EXPECT_EQ(sdb.get_committed_storage(CONTRACT_ADDR, word(1)), word(0x6f));
    EXPECT_EQ(step.reversible_write_counter_delta, 1);
    EXPECT_EQ(state.current_context().reversible_write_counter, 1);

    const auto& op = blk.container.get<storage_op>(step.bus_mapping_instance[0]);
    EXPECT_TRUE(op.reversible);
    EXPECT_TRUE(op.is_write());
    EXPECT_EQ(op.op.value_prev, word(0x6f));
    const auto reversed = op.op.reverse();
    EXPECT_EQ(reversed.value, word(0x6f));
    EXPECT_EQ(reversed.value_prev, word(0x70));
}

TEST_F(StateRefTest, reversible_write_needs_a_frame) {
    exec_step step;
    try {
        state.push_op_reversible(step, tx_refund_op {1, 10, 0});
        FAIL() << "reversible write without frame accepted";
    } catch (const bus_mapping_error& e) {
        EXPECT_EQ(e.kind(), error_kind::internal_invariant_violation);
    }
}

TEST_F(StateRefTest, call_context_values_follow_writes) {
    open_root_call();
    auto& ctx = state.current_context();
    EXPECT_EQ(state.call_context_value(ctx, call_context_field::IsRoot), word(1));
    EXPECT_EQ(state.call_context_value(ctx, call_context_field::CalleeAddress), word(CONTRACT_ADDR));

    exec_step step;
    state.call_context_write(step, ctx, call_context_field::ProgramCounter, word(42));
    EXPECT_EQ(state.call_context_read(step, ctx, call_context_field::ProgramCounter), word(42));
}

TEST_F(StateRefTest, copy_event_counts_memory_accesses) {
    open_root_call();
    exec_step step;
    copy_event event {copy_data_type::memory, 1, 0, 3, copy_data_type::tx_log, 1, 0, 0, 1,
                      {{1, false}, {2, false}, {3, false}}};
    state.push_copy(step, event);
    EXPECT_EQ(step.copy_rw_counter_delta, 6);
    EXPECT_EQ(blk.copy_events.size(), 1);
}
