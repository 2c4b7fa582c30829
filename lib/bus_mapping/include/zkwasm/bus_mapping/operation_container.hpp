//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#ifndef ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_OPERATION_CONTAINER_HPP_
#define ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_OPERATION_CONTAINER_HPP_

#include <zkwasm/bus_mapping/error.hpp>
#include <zkwasm/bus_mapping/operation.hpp>

#include <cstdint>
#include <tuple>
#include <utility>
#include <vector>

namespace zkwasm {
    namespace bus_mapping {

        /// Stable handle of an operation: its kind and its index inside the
        /// vector of that kind.
        struct operation_ref {
            std::uint8_t tag;
            std::size_t index;

            bool operator==(const operation_ref& other) const {
                return tag == other.tag && index == other.index;
            }
        };

        std::ostream& operator<<(std::ostream& os, const operation_ref& ref);

        /// Append-only log with one vector per operation kind.
        class operation_container {
        public:
            template<typename Op>
            using vector_type = std::vector<operation<Op>>;

            template<typename Op>
            operation_ref insert(operation<Op> op) {
                auto& ops = std::get<vector_type<Op>>(m_ops);
                ops.push_back(std::move(op));
                return {Op::tag, ops.size() - 1};
            }

            template<typename Op>
            const vector_type<Op>& get() const {
                return std::get<vector_type<Op>>(m_ops);
            }

            template<typename Op>
            const operation<Op>& get(const operation_ref& ref) const {
                if (ref.tag != Op::tag) {
                    throw internal_error("operation reference points to another kind");
                }
                const auto& ops = get<Op>();
                if (ref.index >= ops.size()) {
                    throw internal_error("operation reference out of range");
                }
                return ops[ref.index];
            }

            /// Calls `f` with the operation `ref` points to.
            template<typename F>
            decltype(auto) visit(const operation_ref& ref, F&& f) const {
                switch (ref.tag) {
                    case STACK_OP: return f(get<stack_op>(ref));
                    case MEMORY_OP: return f(get<memory_op>(ref));
                    case STORAGE_OP: return f(get<storage_op>(ref));
                    case CALL_CONTEXT_OP: return f(get<call_context_op>(ref));
                    case ACCOUNT_OP: return f(get<account_op>(ref));
                    case TX_REFUND_OP: return f(get<tx_refund_op>(ref));
                    case TX_ACCESS_LIST_ACCOUNT_OP: return f(get<tx_access_list_account_op>(ref));
                    case TX_ACCESS_LIST_ACCOUNT_STORAGE_OP: return f(get<tx_access_list_account_storage_op>(ref));
                    case TX_LOG_OP: return f(get<tx_log_op>(ref));
                    case TX_RECEIPT_OP: return f(get<tx_receipt_op>(ref));
                    default: break;
                }
                throw internal_error("unknown operation tag");
            }

            std::size_t rwc_of(const operation_ref& ref) const;
            bool is_write(const operation_ref& ref) const;

            /// Total number of operations of every kind.
            std::size_t size() const;

            /// Every operation's counter value, ordered by counter.
            std::vector<std::size_t> sorted_rw_counters() const;

        private:
            std::tuple<vector_type<stack_op>,
                       vector_type<memory_op>,
                       vector_type<storage_op>,
                       vector_type<call_context_op>,
                       vector_type<account_op>,
                       vector_type<tx_refund_op>,
                       vector_type<tx_access_list_account_op>,
                       vector_type<tx_access_list_account_storage_op>,
                       vector_type<tx_log_op>,
                       vector_type<tx_receipt_op>>
                m_ops;
        };

    }    // namespace bus_mapping
}    // namespace zkwasm

#endif    // ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_OPERATION_CONTAINER_HPP_
