//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#include <zkwasm/bus_mapping/error.hpp>

namespace zkwasm {
    namespace bus_mapping {

        const char* error_kind_name(error_kind kind) {
            switch (kind) {
                case error_kind::malformed_trace: return "malformed trace";
                case error_kind::out_of_range_access: return "out of range access";
                case error_kind::internal_invariant_violation: return "internal invariant violation";
                case error_kind::unsupported_opcode: return "unsupported opcode";
                case error_kind::capacity_exceeded: return "capacity exceeded";
            }
            return "unknown error";
        }

    }    // namespace bus_mapping
}    // namespace zkwasm
