//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#include <zkwasm/bus_mapping/rw_table.hpp>

#include <boost/log/trivial.hpp>

#include <algorithm>
#include <string>

namespace zkwasm {
    namespace bus_mapping {

        std::ostream& operator<<(std::ostream& os, const rw_row& obj) {
            os << operation_tag_name(obj.op) << ": ";
            os << obj.rw_id << ", id = " << obj.id << ", addr = " << obj.address;
            if (obj.op == STORAGE_OP || obj.op == TX_ACCESS_LIST_ACCOUNT_STORAGE_OP)
                os << " storage_key = " << obj.storage_key;
            if (obj.is_write) os << " W "; else os << " R ";
            os << "[" << obj.value_prev << "] => ";
            os << "[" << obj.value << "]";
            return os;
        }

        rw_row start_row() {
            return rw_row({START_OP, 0, 0, 0, 0, 0, false, 0, 0});
        }

        rw_row padding_row() {
            return rw_row({PADDING_OP, 0, 0, 0, 0, 0, false, 0, 0});
        }

        rw_row to_rw_row(const operation<stack_op>& op) {
            return rw_row({STACK_OP, op.op.call_id, op.op.address, 0, 0, op.rwc, op.is_write(), op.op.value, 0});
        }

        rw_row to_rw_row(const operation<memory_op>& op) {
            return rw_row({MEMORY_OP, op.op.call_id, op.op.address, 0, 0, op.rwc, op.is_write(), op.op.value, 0});
        }

        rw_row to_rw_row(const operation<storage_op>& op) {
            return rw_row({STORAGE_OP, op.op.tx_id, op.op.address, 0, op.op.key, op.rwc, op.is_write(), op.op.value,
                           op.op.value_prev});
        }

        rw_row to_rw_row(const operation<call_context_op>& op) {
            return rw_row({CALL_CONTEXT_OP, op.op.call_id, 0, static_cast<std::uint8_t>(op.op.field), 0, op.rwc,
                           op.is_write(), op.op.value, 0});
        }

        rw_row to_rw_row(const operation<account_op>& op) {
            return rw_row({ACCOUNT_OP, 0, op.op.address, static_cast<std::uint8_t>(op.op.field), 0, op.rwc,
                           op.is_write(), op.op.value, op.op.value_prev});
        }

        rw_row to_rw_row(const operation<tx_refund_op>& op) {
            return rw_row({TX_REFUND_OP, op.op.tx_id, 0, 0, 0, op.rwc, op.is_write(), op.op.value, op.op.value_prev});
        }

        rw_row to_rw_row(const operation<tx_access_list_account_op>& op) {
            return rw_row({TX_ACCESS_LIST_ACCOUNT_OP, op.op.tx_id, op.op.address, 0, 0, op.rwc, op.is_write(),
                           op.op.is_warm, op.op.is_warm_prev});
        }

        rw_row to_rw_row(const operation<tx_access_list_account_storage_op>& op) {
            return rw_row({TX_ACCESS_LIST_ACCOUNT_STORAGE_OP, op.op.tx_id, op.op.address, 0, op.op.key, op.rwc,
                           op.is_write(), op.op.is_warm, op.op.is_warm_prev});
        }

        rw_row to_rw_row(const operation<tx_log_op>& op) {
            return rw_row({TX_LOG_OP, op.op.tx_id, op.op.index, static_cast<std::uint8_t>(op.op.field), op.op.log_id,
                           op.rwc, op.is_write(), op.op.value, 0});
        }

        rw_row to_rw_row(const operation<tx_receipt_op>& op) {
            return rw_row({TX_RECEIPT_OP, op.op.tx_id, 0, static_cast<std::uint8_t>(op.op.field), 0, op.rwc,
                           op.is_write(), op.op.value, 0});
        }

        namespace {
            template<typename Op>
            void append_rows(std::vector<rw_row>& rows, const operation_container& container) {
                for (const auto& op : container.get<Op>()) {
                    rows.push_back(to_rw_row(op));
                }
            }
        }    // namespace

        std::vector<rw_row> build_rw_table(const operation_container& container, std::size_t max_rws) {
            const std::size_t total = container.size();
            if (max_rws != 0 && total + 1 > max_rws) {
                throw bus_mapping_error(error_kind::capacity_exceeded,
                                        "rw table holds " + std::to_string(max_rws) + " rows, " +
                                            std::to_string(total + 1) + " needed");
            }

            std::vector<rw_row> rows;
            rows.reserve(std::max(max_rws, total + 1));
            append_rows<stack_op>(rows, container);
            append_rows<memory_op>(rows, container);
            append_rows<storage_op>(rows, container);
            append_rows<call_context_op>(rows, container);
            append_rows<account_op>(rows, container);
            append_rows<tx_refund_op>(rows, container);
            append_rows<tx_access_list_account_op>(rows, container);
            append_rows<tx_access_list_account_storage_op>(rows, container);
            append_rows<tx_log_op>(rows, container);
            append_rows<tx_receipt_op>(rows, container);

            //sort operations
            std::sort(rows.begin(), rows.end());
            rows.insert(rows.begin(), start_row());

            while (rows.size() < max_rws) {
                rows.push_back(padding_row());
            }
            BOOST_LOG_TRIVIAL(debug) << "RW table: " << total << " operations, " << rows.size() << " rows";
            return rows;
        }

    }    // namespace bus_mapping
}    // namespace zkwasm
