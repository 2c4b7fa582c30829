//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#ifndef ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_TX_CONTEXT_HPP_
#define ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_TX_CONTEXT_HPP_

#include <zkwasm/bus_mapping/call.hpp>
#include <zkwasm/bus_mapping/operation_container.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace zkwasm {
    namespace bus_mapping {

        /// Frame that recorded into a reversion group and finished.
        struct reversion_member {
            std::size_t call_index;
            std::size_t offset;
            std::size_t count;
        };

        /// Reversible writes to undo when the owning frame fails.
        struct reversion_group {
            std::size_t owner;
            std::vector<operation_ref> ops;
            std::vector<reversion_member> members;
        };

        /// Call stack and reversion bookkeeping of the transaction being built.
        class tx_context {
        public:
            /// `calls_success` is indexed by call position in the transaction.
            /// `eor_hints` holds the end of reversion of every call as resolved
            /// by an earlier build of the same transaction, empty on that
            /// earlier build.
            tx_context(std::size_t id, std::vector<bool> calls_success, std::vector<std::size_t> eor_hints);

            std::size_t id() const {
                return m_id;
            }

            bool call_success(std::size_t call_index) const;

            /// End of reversion to open a non persistent frame with.
            std::size_t eor_hint(std::size_t call_index) const;

            void resolve_eor(std::size_t call_index, std::size_t eor);

            /// Ends of reversion resolved so far, 0 for persistent frames.
            const std::vector<std::size_t>& resolved_eor() const {
                return m_resolved_eor;
            }

            bool has_call() const {
                return !m_calls.empty();
            }

            std::size_t call_depth() const {
                return m_calls.size();
            }

            call_context& current();
            const call_context& current() const;
            call_context& caller();

            void push_call(call_context ctx, bool is_success);
            call_context pop_call();

            /// Records a reversible write of the current frame.
            void record_reversible(const operation_ref& ref);

            /// Group owned by the current frame, which must be failing.
            reversion_group take_group();

            void add_member(std::size_t group, const reversion_member& member);

        private:
            std::size_t m_id;
            std::vector<bool> m_calls_success;
            std::vector<std::size_t> m_eor_hints;
            std::vector<std::size_t> m_resolved_eor;
            std::vector<call_context> m_calls;
            std::vector<reversion_group> m_groups;
            /// Groups of the failing frames on the call stack, innermost last.
            std::vector<std::size_t> m_active_groups;
        };

    }    // namespace bus_mapping
}    // namespace zkwasm

#endif    // ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_TX_CONTEXT_HPP_
