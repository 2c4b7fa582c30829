//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#ifndef ZKWASM_BUS_MAPPING_TEST_MOCK_TRACE_HPP_
#define ZKWASM_BUS_MAPPING_TEST_MOCK_TRACE_HPP_

#include <zkwasm/bus_mapping/builder.hpp>
#include <zkwasm/bus_mapping/operation_container.hpp>
#include <zkwasm/bus_mapping/state_db.hpp>
#include <zkwasm/bus_mapping/trace.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <initializer_list>
#include <map>
#include <tuple>
#include <vector>

using namespace zkwasm::bus_mapping;
using namespace evmc::literals;

const evmc::address SENDER_ADDR = 0x00000000000000000000000000000000000000fe_address;
const evmc::address CONTRACT_ADDR = 0x00000000000000000000000000000000000000aa_address;
const evmc::address CALLEE_ADDR = 0x00000000000000000000000000000000000000bb_address;
const evmc::address INNER_CALLEE_ADDR = 0x00000000000000000000000000000000000000cc_address;

const bytes CONTRACT_CODE = {0x41, 0x07, 0x1a, 0x0b, 0x00};

/// Trace step with a stack given bottom first.
inline trace_step mock_step(opcode_id op, std::initializer_list<word> stack, std::size_t depth = 1) {
    trace_step step;
    step.op = op;
    step.gas = 100000;
    step.gas_cost = 3;
    step.depth = depth;
    step.stack.items.assign(stack.begin(), stack.end());
    return step;
}

inline trace_step mock_step_with_memory(opcode_id op, std::initializer_list<word> stack, bytes memory,
                                        std::size_t depth = 1) {
    auto step = mock_step(op, stack, depth);
    step.memory = std::move(memory);
    return step;
}

/// 64 bytes of memory holding the big-endian words `first` and `second`.
inline bytes two_words_memory(const word& first, const word& second) {
    const auto a = first.to_be_bytes();
    const auto b = second.to_be_bytes();
    bytes res(a.begin(), a.end());
    res.insert(res.end(), b.begin(), b.end());
    return res;
}

/// CALL operands, bottom first: ret_length, ret_offset, args_length,
/// args_offset, value, address, gas.
inline trace_step mock_call_step(const evmc::address& callee, const word& value, std::size_t depth = 1) {
    return mock_step(OP_CALL, {0, 0, 0, 0, value, word(callee), 50000}, depth);
}

inline exec_trace mock_trace(std::vector<trace_step> steps, bool failed = false) {
    exec_trace trace;
    trace.gas = 21000;
    trace.failed = failed;
    trace.steps = std::move(steps);
    return trace;
}

inline transaction_data mock_tx(bytes input = {}, const word& value = 0) {
    transaction_data data;
    data.from = SENDER_ADDR;
    data.to = CONTRACT_ADDR;
    data.value = value;
    data.gas = 1000000;
    data.input = std::move(input);
    return data;
}

class BusMappingTest : public testing::Test {
public:
    void SetUp() override {
        contract_code_hash = cdb.insert(CONTRACT_CODE);
        sdb.set_account(SENDER_ADDR, account {0, word(1000000000), EMPTY_CODE_HASH});
        sdb.set_account(CONTRACT_ADDR, account {1, word(0), contract_code_hash});
        sdb.set_account(CALLEE_ADDR, account {1, word(0), contract_code_hash});
        sdb.set_account(INNER_CALLEE_ADDR, account {1, word(0), contract_code_hash});
    }

    circuit_input_builder make_builder(builder_config config = {}) const {
        return circuit_input_builder(sdb, cdb, config);
    }

    /// Builds a single transaction over the fixture state.
    circuit_input_builder build(const transaction_data& data, const exec_trace& trace, builder_config config = {}) {
        auto builder = make_builder(config);
        builder.handle_tx(data, trace);
        return builder;
    }

    state_db sdb;
    code_db cdb;
    evmc::bytes32 contract_code_hash;
};

/// Step `index` of the only transaction, BeginTx being step 0.
inline const exec_step& tx_step(const circuit_input_builder& builder, std::size_t index) {
    return builder.block().txs.at(0).steps.at(index);
}

template<typename Op>
inline const operation<Op>& step_op(const circuit_input_builder& builder, const exec_step& step, std::size_t i) {
    return builder.block().container.get<Op>(step.bus_mapping_instance.at(i));
}

inline std::size_t count_ops(const exec_step& step, std::uint8_t tag) {
    std::size_t res = 0;
    for (const auto& ref : step.bus_mapping_instance) {
        if (ref.tag == tag) {
            ++res;
        }
    }
    return res;
}

/// Operations of `step` are numbered consecutively from the step counter.
inline void step_rwc_check(const operation_container& container, const exec_step& step) {
    for (std::size_t i = 0; i < step.bus_mapping_instance.size(); ++i) {
        EXPECT_EQ(container.rwc_of(step.bus_mapping_instance[i]), step.rwc + i);
    }
}

/// World state rebuilt from the state operations alone.
struct replay_state {
    std::map<std::tuple<evmc::address, word>, word> storage;
    std::map<std::tuple<evmc::address, account_field>, word> accounts;
    std::map<std::size_t, std::uint64_t> refunds;
    std::map<std::tuple<std::size_t, evmc::address>, bool> warm_accounts;
    std::map<std::tuple<std::size_t, evmc::address, word>, bool> warm_slots;
};

/// Seeding keeps the first value a key was seen with. Replaying checks that
/// each operation continues the state left by the ones before it.
template<typename Key, typename Value>
inline void replay_entry(std::map<Key, Value>& entries, const Key& key, bool is_write, const Value& value,
                         const Value& value_prev, std::size_t rwc, bool seed) {
    const Value& before = is_write ? value_prev : value;
    if (seed) {
        entries.emplace(key, before);
        return;
    }
    auto it = entries.find(key);
    if (it == entries.end()) {
        ADD_FAILURE() << "operation " << rwc << " touches a key no operation seeded";
        return;
    }
    EXPECT_EQ(it->second, before) << "operation " << rwc << " does not continue the replayed state";
    if (is_write) {
        it->second = value;
    }
}

inline void replay_op(replay_state& s, const operation<storage_op>& o, bool seed) {
    replay_entry(s.storage, std::make_tuple(o.op.address, o.op.key), o.is_write(), o.op.value, o.op.value_prev,
                 o.rwc, seed);
}

inline void replay_op(replay_state& s, const operation<account_op>& o, bool seed) {
    replay_entry(s.accounts, std::make_tuple(o.op.address, o.op.field), o.is_write(), o.op.value, o.op.value_prev,
                 o.rwc, seed);
}

inline void replay_op(replay_state& s, const operation<tx_refund_op>& o, bool seed) {
    replay_entry(s.refunds, o.op.tx_id, o.is_write(), o.op.value, o.op.value_prev, o.rwc, seed);
}

/// Warmth only grows within a transaction, undo entries never withdraw it.
template<typename Key>
inline void replay_warmth(std::map<Key, bool>& entries, const Key& key, bool is_warm, bool is_warm_prev,
                          std::size_t rwc, bool seed) {
    if (seed) {
        entries.emplace(key, is_warm_prev);
        return;
    }
    auto it = entries.find(key);
    if (it == entries.end()) {
        ADD_FAILURE() << "access list operation " << rwc << " touches a key no operation seeded";
        return;
    }
    EXPECT_EQ(it->second, is_warm_prev) << "access list operation " << rwc << " does not continue the replayed state";
    it->second = it->second || is_warm;
}

inline void replay_op(replay_state& s, const operation<tx_access_list_account_op>& o, bool seed) {
    replay_warmth(s.warm_accounts, std::make_tuple(o.op.tx_id, o.op.address), o.op.is_warm, o.op.is_warm_prev,
                  o.rwc, seed);
}

inline void replay_op(replay_state& s, const operation<tx_access_list_account_storage_op>& o, bool seed) {
    replay_warmth(s.warm_slots, std::make_tuple(o.op.tx_id, o.op.address, o.op.key), o.op.is_warm,
                  o.op.is_warm_prev, o.rwc, seed);
}

// Stack, memory, call context, log and receipt operations hold no world state.
template<typename Op>
inline void replay_op(replay_state&, const operation<Op>&, bool) {}

/// State operations of a block in counter order.
class state_replay {
public:
    explicit state_replay(const operation_container& container) : m_container(container) {
        collect<storage_op>();
        collect<account_op>();
        collect<tx_refund_op>();
        collect<tx_access_list_account_op>();
        collect<tx_access_list_account_storage_op>();
        std::sort(m_ops.begin(), m_ops.end(), [&](const operation_ref& a, const operation_ref& b) {
            return m_container.rwc_of(a) < m_container.rwc_of(b);
        });
        for (const auto& ref : m_ops) {
            m_container.visit(ref, [&](const auto& o) { replay_op(m_initial, o, true); });
        }
    }

    /// State after every operation with a counter in [begin, end).
    replay_state apply(replay_state s, std::size_t begin, std::size_t end) const {
        for (const auto& ref : m_ops) {
            const std::size_t rwc = m_container.rwc_of(ref);
            if (rwc >= begin && rwc < end) {
                m_container.visit(ref, [&](const auto& o) { replay_op(s, o, false); });
            }
        }
        return s;
    }

    /// State before the operation with counter `rwc`.
    replay_state before(std::size_t rwc) const {
        return apply(m_initial, 0, rwc);
    }

private:
    template<typename Op>
    void collect() {
        const auto& ops = m_container.get<Op>();
        for (std::size_t i = 0; i < ops.size(); ++i) {
            m_ops.push_back({Op::tag, i});
        }
    }

    const operation_container& m_container;
    replay_state m_initial;
    std::vector<operation_ref> m_ops;
};

/// Replays the stack and memory operations of one step over its trace
/// entry. Reads must see the entry, and written locations must end up as
/// the lookahead entry of the same frame shows them.
inline void replay_step_check(const operation_container& container, std::size_t call_id, const exec_step& step,
                              const step_window& window) {
    const auto& pre = window.current();
    if (pre.error) {
        return;
    }

    std::map<std::uint16_t, word> stack;
    for (std::size_t k = 0; k < pre.stack.size(); ++k) {
        stack[static_cast<std::uint16_t>(STACK_CAPACITY - 1 - k)] = pre.stack.items[k];
    }
    std::map<std::uint64_t, std::uint8_t> memory;
    std::map<std::uint16_t, word> stack_written;
    std::map<std::uint64_t, std::uint8_t> memory_written;

    for (const auto& ref : step.bus_mapping_instance) {
        if (ref.tag == STACK_OP) {
            const auto& o = container.get<stack_op>(ref);
            if (o.op.call_id != call_id) {
                continue;
            }
            if (o.is_write()) {
                stack[o.op.address] = o.op.value;
                stack_written[o.op.address] = o.op.value;
                continue;
            }
            const auto it = stack.find(o.op.address);
            ASSERT_TRUE(it != stack.end()) << "step " << step.rwc << " reads stack address " << o.op.address
                                       << " below the trace stack";
            EXPECT_EQ(it->second, o.op.value) << "stack read at " << o.rwc;
        } else if (ref.tag == MEMORY_OP) {
            const auto& o = container.get<memory_op>(ref);
            if (o.op.call_id != call_id) {
                continue;
            }
            if (o.is_write()) {
                memory[o.op.address] = o.op.value;
                memory_written[o.op.address] = o.op.value;
                continue;
            }
            const auto it = memory.find(o.op.address);
            if (it != memory.end()) {
                EXPECT_EQ(it->second, o.op.value) << "memory read at " << o.rwc;
            } else if (!pre.memory.empty()) {
                const std::uint8_t expected = o.op.address < pre.memory.size() ? pre.memory[o.op.address] : 0;
                EXPECT_EQ(o.op.value, expected) << "memory read at " << o.rwc;
            }
        }
    }

    // Frame changes leave no lookahead of this frame.
    if (!window.has_next() || window.next().depth != pre.depth) {
        return;
    }
    const auto& post = window.next();
    for (const auto& [address, value] : stack_written) {
        const std::size_t k = STACK_CAPACITY - 1 - address;
        ASSERT_LT(k, post.stack.size()) << "stack address " << address << " is above the lookahead stack";
        EXPECT_EQ(post.stack.items[k], value) << "stack address " << address << " after step " << step.rwc;
    }
    for (const auto& [address, value] : memory_written) {
        ASSERT_LT(address, post.memory.size()) << "memory address " << address << " is beyond the lookahead memory";
        EXPECT_EQ(post.memory[address], value) << "memory address " << address << " after step " << step.rwc;
    }
}

/// Replays a built block against the traces it was built from. Every step
/// reproduces its lookahead entry, state operations chain, and the undo
/// operations of each reverted frame restore the state it was entered with.
inline void replay_block_check(const circuit_input_builder& builder, const std::vector<exec_trace>& traces) {
    const auto& block = builder.block();
    ASSERT_EQ(block.txs.size(), traces.size());
    const state_replay replay(block.container);
    // Chains every state operation of the block.
    replay.before(block.container.size() + 1);

    for (std::size_t t = 0; t < traces.size(); ++t) {
        const auto& tx = block.txs[t];
        const auto& steps = traces[t].steps;
        // BeginTx and EndTx surround one step per trace entry.
        ASSERT_EQ(tx.steps.size(), steps.size() + 2);
        for (std::size_t i = 0; i < steps.size(); ++i) {
            const auto& step = tx.steps[i + 1];
            replay_step_check(block.container, tx.calls.at(step.call_index).call_id, step, step_window(steps, i));
        }

        for (const auto& c : tx.calls) {
            // The root frame is entered after BeginTx has written the transaction setup.
            if (c.is_persistent || c.is_root) {
                continue;
            }
            const std::size_t eor = c.rw_counter_end_of_reversion;
            ASSERT_GT(eor, c.call_id);
            const auto entered = replay.before(c.call_id);
            const auto undone = replay.apply(replay.before(eor), eor, eor + c.reversible_write_counter);
            // Warmth outlives the revert.
            EXPECT_TRUE(undone.storage == entered.storage) << "storage after undoing call " << c.call_id;
            EXPECT_TRUE(undone.accounts == entered.accounts) << "accounts after undoing call " << c.call_id;
            EXPECT_TRUE(undone.refunds == entered.refunds) << "refunds after undoing call " << c.call_id;
        }
    }
}

#endif    // ZKWASM_BUS_MAPPING_TEST_MOCK_TRACE_HPP_
