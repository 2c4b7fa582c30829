//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#include <zkwasm/bus_mapping/tx_context.hpp>
#include <zkwasm/bus_mapping/error.hpp>

#include <string>
#include <utility>

namespace zkwasm {
    namespace bus_mapping {

        tx_context::tx_context(std::size_t id, std::vector<bool> calls_success, std::vector<std::size_t> eor_hints) :
            m_id(id), m_calls_success(std::move(calls_success)), m_eor_hints(std::move(eor_hints)) {}

        bool tx_context::call_success(std::size_t call_index) const {
            if (call_index >= m_calls_success.size()) {
                throw malformed_trace("no result for call " + std::to_string(call_index));
            }
            return m_calls_success[call_index];
        }

        std::size_t tx_context::eor_hint(std::size_t call_index) const {
            if (m_eor_hints.empty()) {
                return 0;
            }
            if (call_index >= m_eor_hints.size()) {
                throw internal_error("call " + std::to_string(call_index) + " was not seen by the dry run");
            }
            return m_eor_hints[call_index];
        }

        void tx_context::resolve_eor(std::size_t call_index, std::size_t eor) {
            if (m_resolved_eor.size() <= call_index) {
                m_resolved_eor.resize(call_index + 1, 0);
            }
            m_resolved_eor[call_index] = eor;
            if (!m_eor_hints.empty() && eor_hint(call_index) != eor) {
                throw internal_error("rw_counter_end_of_reversion of call " + std::to_string(call_index) +
                                     " opened as " + std::to_string(eor_hint(call_index)) + ", resolved as " +
                                     std::to_string(eor));
            }
        }

        call_context& tx_context::current() {
            if (m_calls.empty()) {
                throw malformed_trace("no open call frame");
            }
            return m_calls.back();
        }

        const call_context& tx_context::current() const {
            if (m_calls.empty()) {
                throw malformed_trace("no open call frame");
            }
            return m_calls.back();
        }

        call_context& tx_context::caller() {
            if (m_calls.size() < 2) {
                throw malformed_trace("root call has no caller");
            }
            return m_calls[m_calls.size() - 2];
        }

        void tx_context::push_call(call_context ctx, bool is_success) {
            if (!is_success) {
                m_groups.push_back(reversion_group{ctx.index, {}, {}});
                m_active_groups.push_back(m_groups.size() - 1);
                ctx.group = m_groups.size() - 1;
                ctx.group_offset = 0;
            } else if (!m_active_groups.empty()) {
                ctx.group = m_active_groups.back();
                ctx.group_offset = m_groups[m_active_groups.back()].ops.size();
            } else {
                ctx.group.reset();
                ctx.group_offset = 0;
            }
            m_calls.push_back(std::move(ctx));
        }

        call_context tx_context::pop_call() {
            if (m_calls.empty()) {
                throw malformed_trace("no open call frame");
            }
            call_context ctx = std::move(m_calls.back());
            m_calls.pop_back();
            return ctx;
        }

        void tx_context::record_reversible(const operation_ref& ref) {
            auto& ctx = current();
            ++ctx.reversible_write_counter;
            if (ctx.group) {
                m_groups[*ctx.group].ops.push_back(ref);
            }
        }

        reversion_group tx_context::take_group() {
            const auto& ctx = current();
            if (m_active_groups.empty() || !ctx.group || *ctx.group != m_active_groups.back() ||
                m_groups[*ctx.group].owner != ctx.index) {
                throw internal_error("call " + std::to_string(ctx.index) + " owns no reversion group");
            }
            m_active_groups.pop_back();
            return std::move(m_groups[*ctx.group]);
        }

        void tx_context::add_member(std::size_t group, const reversion_member& member) {
            if (group >= m_groups.size()) {
                throw internal_error("unknown reversion group " + std::to_string(group));
            }
            m_groups[group].members.push_back(member);
        }

    }    // namespace bus_mapping
}    // namespace zkwasm
