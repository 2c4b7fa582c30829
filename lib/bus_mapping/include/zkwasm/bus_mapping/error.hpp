//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#ifndef ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_ERROR_HPP_
#define ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_ERROR_HPP_

#include <zkwasm/bus_mapping/opcode.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace zkwasm {
    namespace bus_mapping {

        enum class error_kind : std::uint8_t {
            malformed_trace,
            out_of_range_access,
            internal_invariant_violation,
            unsupported_opcode,
            capacity_exceeded
        };

        const char* error_kind_name(error_kind kind);

        /// Fatal error of a block build. The driver attaches the location of
        /// the failing step before the error leaves the builder.
        class bus_mapping_error : public std::runtime_error {
        public:
            bus_mapping_error(error_kind kind, const std::string& what) :
                std::runtime_error(what), m_kind(kind) {}

            error_kind kind() const noexcept {
                return m_kind;
            }

            bool has_location() const noexcept {
                return m_has_location;
            }

            std::size_t step_index() const noexcept {
                return m_step_index;
            }

            opcode_id opcode() const noexcept {
                return m_opcode;
            }

            void set_location(std::size_t step_index, opcode_id op) noexcept {
                if (m_has_location)
                    return;
                m_has_location = true;
                m_step_index = step_index;
                m_opcode = op;
            }

        private:
            error_kind m_kind;
            bool m_has_location = false;
            std::size_t m_step_index = 0;
            opcode_id m_opcode = OP_UNREACHABLE;
        };

        inline bus_mapping_error malformed_trace(const std::string& what) {
            return bus_mapping_error(error_kind::malformed_trace, what);
        }

        inline bus_mapping_error out_of_range_access(const std::string& what) {
            return bus_mapping_error(error_kind::out_of_range_access, what);
        }

        inline bus_mapping_error internal_error(const std::string& what) {
            return bus_mapping_error(error_kind::internal_invariant_violation, what);
        }

    }    // namespace bus_mapping
}    // namespace zkwasm

#endif    // ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_ERROR_HPP_
