//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#include <zkwasm/bus_mapping/operation_container.hpp>

#include <algorithm>

namespace zkwasm {
    namespace bus_mapping {

        std::ostream& operator<<(std::ostream& os, const operation_ref& ref) {
            os << operation_tag_name(ref.tag) << "[" << ref.index << "]";
            return os;
        }

        std::size_t operation_container::rwc_of(const operation_ref& ref) const {
            return visit(ref, [](const auto& op) { return op.rwc; });
        }

        bool operation_container::is_write(const operation_ref& ref) const {
            return visit(ref, [](const auto& op) { return op.is_write(); });
        }

        std::size_t operation_container::size() const {
            return std::apply([](const auto&... ops) { return (ops.size() + ...); }, m_ops);
        }

        std::vector<std::size_t> operation_container::sorted_rw_counters() const {
            std::vector<std::size_t> res;
            res.reserve(size());
            std::apply(
                [&res](const auto&... ops) {
                    auto collect = [&res](const auto& vec) {
                        for (const auto& op : vec) {
                            res.push_back(op.rwc);
                        }
                    };
                    (collect(ops), ...);
                },
                m_ops);
            std::sort(res.begin(), res.end());
            return res;
        }

    }    // namespace bus_mapping
}    // namespace zkwasm
