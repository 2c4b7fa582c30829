//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#include <zkwasm/bus_mapping/exec_step.hpp>

namespace zkwasm {
    namespace bus_mapping {

        std::ostream& operator<<(std::ostream& os, const exec_state& state) {
            switch (state.type) {
                case exec_state::kind::op:
                    os << state.opcode;
                    break;
                case exec_state::kind::begin_tx:
                    os << "BeginTx";
                    break;
                case exec_state::kind::end_tx:
                    os << "EndTx";
                    break;
                case exec_state::kind::error:
                    os << "Error(" << state.opcode << ")";
                    break;
            }
            return os;
        }

    }    // namespace bus_mapping
}    // namespace zkwasm
