//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#ifndef ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_LOGGING_HPP_
#define ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_LOGGING_HPP_

#include <boost/log/trivial.hpp>

#include <string>

namespace zkwasm {
    namespace bus_mapping {

        /// Maps "trace", "debug", "info", "warning", "error" or "fatal" to a
        /// severity, throws std::invalid_argument otherwise.
        boost::log::trivial::severity_level parse_log_level(const std::string& name);

        /// Installs a process-wide severity filter. Builders never call it,
        /// the application does once at startup.
        void init_logging(boost::log::trivial::severity_level level);

    }    // namespace bus_mapping
}    // namespace zkwasm

#endif    // ZKWASM_BUS_MAPPING_INCLUDE_ZKWASM_BUS_MAPPING_LOGGING_HPP_
