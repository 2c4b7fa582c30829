//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#include <zkwasm/bus_mapping/tx_context.hpp>

#include "mock_trace.hpp"

class ReversionTest : public BusMappingTest {};

inline trace_step sstore_step(const word& value, std::size_t depth) {
    // key 0 at offset 0, value at offset 32
    return mock_step_with_memory(OP_SSTORE, {0, 32}, two_words_memory(0, value), depth);
}

/// Value of the callee RwCounterEndOfReversion write made by a CALL step.
inline word callee_eor_written(const circuit_input_builder& builder, const exec_step& call_step) {
    const auto& op = step_op<call_context_op>(builder, call_step, 33);
    EXPECT_EQ(op.op.field, call_context_field::RwCounterEndOfReversion);
    return op.op.value;
}

TEST_F(ReversionTest, reverted_call_undo_interval) {
    sdb.set_storage(CALLEE_ADDR, word(0), word(0x6f));
    const auto trace = mock_trace({mock_call_step(CALLEE_ADDR, 0),
                                   sstore_step(0x70, 2),
                                   mock_step(OP_REVERT, {0, 0}, 2),
                                   mock_step(OP_DROP, {0}),
                                   mock_call_step(CALLEE_ADDR, 0),
                                   sstore_step(0x71, 2),
                                   mock_step(OP_STOP, {}, 2),
                                   mock_step(OP_STOP, {1})});
    auto builder = build(mock_tx(), trace);
    replay_block_check(builder, {trace});
    const auto& tx = builder.block().txs[0];
    ASSERT_EQ(tx.calls.size(), 3);
    const auto& reverted = tx.calls[1];
    EXPECT_FALSE(reverted.is_success);
    EXPECT_FALSE(reverted.is_persistent);
    EXPECT_EQ(reverted.reversible_write_counter, 3);

    const auto& revert = tx_step(builder, 3);
    ASSERT_EQ(revert.bus_mapping_instance.size(), 2 + 10 + 3);
    step_rwc_check(builder.block().container, revert);
    const std::size_t eor = builder.block().container.rwc_of(revert.bus_mapping_instance[12]);
    EXPECT_EQ(reverted.rw_counter_end_of_reversion, eor);
    EXPECT_EQ(callee_eor_written(builder, tx_step(builder, 1)), word(eor));

    // Undo operations in reverse creation order.
    const auto& refund = step_op<tx_refund_op>(builder, revert, 12);
    EXPECT_TRUE(refund.is_write());
    const auto& access = step_op<tx_access_list_account_storage_op>(builder, revert, 13);
    EXPECT_FALSE(access.op.is_warm);
    EXPECT_TRUE(access.op.is_warm_prev);
    const auto& storage = step_op<storage_op>(builder, revert, 14);
    EXPECT_EQ(storage.op.value, word(0x6f));
    EXPECT_EQ(storage.op.value_prev, word(0x70));

    // The failed call's flag is 0 and its writes are not counted by the caller.
    EXPECT_EQ(step_op<stack_op>(builder, tx_step(builder, 1), 15).op.value, word(0));
    EXPECT_EQ(tx.calls[0].reversible_write_counter, 2 + 3);

    // Storage is restored and the slot stays warm for the next call.
    const auto& second = tx_step(builder, 6);
    EXPECT_EQ(step_op<storage_op>(builder, second, 7).op.value_prev, word(0x6f));
    EXPECT_TRUE(step_op<tx_access_list_account_storage_op>(builder, second, 8).op.is_warm_prev);
    EXPECT_TRUE(tx.calls[2].is_persistent);
    EXPECT_EQ(tx.calls[2].rw_counter_end_of_reversion, 0);
    EXPECT_EQ(builder.sdb().get_storage(CALLEE_ADDR, word(0)), word(0x71));
}

TEST_F(ReversionTest, successful_child_of_reverted_call) {
    const auto trace = mock_trace({mock_call_step(CALLEE_ADDR, 0),
                                   mock_call_step(INNER_CALLEE_ADDR, 0, 2),
                                   sstore_step(1, 3),
                                   mock_step(OP_STOP, {}, 3),
                                   mock_step(OP_DROP, {1}, 2),
                                   sstore_step(2, 2),
                                   mock_step(OP_REVERT, {0, 0}, 2),
                                   mock_step(OP_DROP, {0}),
                                   mock_step(OP_STOP, {})});
    auto builder = build(mock_tx(), trace);
    replay_block_check(builder, {trace});
    const auto& tx = builder.block().txs[0];
    ASSERT_EQ(tx.calls.size(), 3);
    const auto& outer = tx.calls[1];
    const auto& inner = tx.calls[2];
    EXPECT_FALSE(outer.is_success);
    EXPECT_TRUE(inner.is_success);
    EXPECT_FALSE(inner.is_persistent);
    EXPECT_EQ(inner.reversible_write_counter, 3);
    // access list write of the inner CALL, the inner call's writes, own writes
    EXPECT_EQ(outer.reversible_write_counter, 1 + 3 + 3);

    const auto& revert = tx_step(builder, 7);
    ASSERT_EQ(revert.bus_mapping_instance.size(), 2 + 10 + 7);
    step_rwc_check(builder.block().container, revert);
    const std::size_t r = builder.block().container.rwc_of(revert.bus_mapping_instance[12]);
    EXPECT_EQ(outer.rw_counter_end_of_reversion, r);
    EXPECT_EQ(inner.rw_counter_end_of_reversion, r + 3);
    EXPECT_EQ(callee_eor_written(builder, tx_step(builder, 1)), word(r));
    EXPECT_EQ(callee_eor_written(builder, tx_step(builder, 2)), word(r + 3));

    // The inner call's undo operations occupy [r + 3, r + 6).
    EXPECT_EQ(revert.bus_mapping_instance[15].tag, TX_REFUND_OP);
    const auto& inner_storage = step_op<storage_op>(builder, revert, 17);
    EXPECT_EQ(inner_storage.op.address, INNER_CALLEE_ADDR);
    EXPECT_EQ(inner_storage.op.value, word(0));
    const auto& inner_access = step_op<tx_access_list_account_op>(builder, revert, 18);
    EXPECT_EQ(inner_access.op.address, INNER_CALLEE_ADDR);
    EXPECT_FALSE(inner_access.op.is_warm);

    EXPECT_EQ(builder.sdb().get_storage(INNER_CALLEE_ADDR, word(0)), word(0));
    EXPECT_EQ(builder.sdb().get_storage(CALLEE_ADDR, word(0)), word(0));
}

TEST_F(ReversionTest, failed_root_with_error_step) {
    auto failing = mock_step(OP_I32_ADD, {1});
    failing.error = "stack underflow";
    auto builder =
        build(mock_tx(), mock_trace({mock_step_with_memory(OP_SSTORE, {0, 32}, two_words_memory(0, 5)), failing},
                                    true/*failed*/));
    const auto& tx = builder.block().txs[0];
    EXPECT_FALSE(tx.is_success);
    EXPECT_FALSE(tx.calls[0].is_persistent);

    const auto& error = tx_step(builder, 2);
    EXPECT_EQ(error.state, exec_state::error(OP_I32_ADD));
    EXPECT_EQ(error.error, std::optional<std::string>("stack underflow"));
    // IsSuccess read, then three undo operations
    ASSERT_EQ(error.bus_mapping_instance.size(), 4);
    EXPECT_EQ(tx.calls[0].rw_counter_end_of_reversion, error.rwc + 1);
    EXPECT_EQ(step_op<call_context_op>(builder, tx_step(builder, 0), 1).op.value, word(error.rwc + 1));
    EXPECT_EQ(builder.sdb().get_storage(CONTRACT_ADDR, word(0)), word(0));

    const auto& end = tx.steps.back();
    EXPECT_EQ(step_op<tx_receipt_op>(builder, end, 2).op.value, 0);
}

TEST_F(ReversionTest, error_in_successful_call) {
    auto failing = mock_step(OP_I32_ADD, {1}, 2);
    failing.error = "stack underflow";
    auto builder = make_builder();
    try {
        builder.handle_tx(mock_tx(),
                          mock_trace({mock_call_step(CALLEE_ADDR, 0), failing, mock_step(OP_STOP, {1})}));
        FAIL() << "error step in a successful call accepted";
    } catch (const bus_mapping_error& e) {
        EXPECT_EQ(e.kind(), error_kind::malformed_trace);
        EXPECT_EQ(e.step_index(), 1);
    }
}

TEST_F(ReversionTest, revert_in_successful_root) {
    auto builder = make_builder();
    try {
        builder.handle_tx(mock_tx(), mock_trace({mock_step(OP_REVERT, {0, 0})}));
        FAIL() << "REVERT in a successful root accepted";
    } catch (const bus_mapping_error& e) {
        EXPECT_EQ(e.kind(), error_kind::malformed_trace);
        EXPECT_EQ(e.opcode(), OP_REVERT);
    }
}

TEST_F(ReversionTest, end_of_reversion_mismatch) {
    tx_context ctx(1, {true, false}, {0, 40});
    EXPECT_EQ(ctx.eor_hint(1), 40);
    ctx.resolve_eor(1, 40);
    try {
        ctx.resolve_eor(1, 41);
        FAIL() << "mismatching end of reversion accepted";
    } catch (const bus_mapping_error& e) {
        EXPECT_EQ(e.kind(), error_kind::internal_invariant_violation);
    }
}

TEST_F(ReversionTest, group_membership) {
    tx_context ctx(1, {false, true}, {});
    call_context root;
    root.index = 0;
    ctx.push_call(root, false);
    ctx.record_reversible({STORAGE_OP, 0});

    call_context child;
    child.index = 1;
    ctx.push_call(child, true);
    EXPECT_EQ(ctx.current().group, std::optional<std::size_t>(0));
    EXPECT_EQ(ctx.current().group_offset, 1);
    ctx.record_reversible({STORAGE_OP, 1});
    ctx.add_member(*ctx.current().group, {1, 1, 1});
    ctx.pop_call();
    ctx.current().reversible_write_counter += 1;

    const auto group = ctx.take_group();
    EXPECT_EQ(group.owner, 0);
    ASSERT_EQ(group.ops.size(), 2);
    EXPECT_EQ(group.ops[1], (operation_ref {STORAGE_OP, 1}));
    ASSERT_EQ(group.members.size(), 1);
    EXPECT_EQ(group.members[0].call_index, 1);
}

TEST_F(ReversionTest, trace_ending_with_open_frames) {
    auto builder = make_builder();
    try {
        builder.handle_tx(mock_tx(), mock_trace({mock_call_step(CALLEE_ADDR, 0), mock_step(OP_STOP, {}, 2)}));
        FAIL() << "unfinished trace accepted";
    } catch (const bus_mapping_error& e) {
        EXPECT_EQ(e.kind(), error_kind::malformed_trace);
        EXPECT_TRUE(e.has_location());
        EXPECT_EQ(e.step_index(), 1);
        EXPECT_EQ(e.opcode(), OP_STOP);
    }
}

TEST_F(ReversionTest, step_after_root_completed) {
    auto builder = make_builder();
    try {
        builder.handle_tx(mock_tx(), mock_trace({mock_step(OP_STOP, {}), mock_step(OP_STOP, {})}));
        FAIL() << "step after the root completed accepted";
    } catch (const bus_mapping_error& e) {
        EXPECT_EQ(e.kind(), error_kind::malformed_trace);
        EXPECT_EQ(e.step_index(), 1);
    }
}
