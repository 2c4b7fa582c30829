//---------------------------------------------------------------------------//
// Copyright (c) Nil Foundation and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.
//---------------------------------------------------------------------------//

#include <zkwasm/bus_mapping/logging.hpp>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>

#include <map>
#include <stdexcept>

namespace zkwasm {
    namespace bus_mapping {

        static const std::map<std::string, boost::log::trivial::severity_level> log_levels_map = {
            {"trace", boost::log::trivial::trace},
            {"debug", boost::log::trivial::debug},
            {"info", boost::log::trivial::info},
            {"warning", boost::log::trivial::warning},
            {"error", boost::log::trivial::error},
            {"fatal", boost::log::trivial::fatal}
        };

        boost::log::trivial::severity_level parse_log_level(const std::string& name) {
            const auto it = log_levels_map.find(name);
            if (it == log_levels_map.end()) {
                throw std::invalid_argument("Unknown log level " + name);
            }
            return it->second;
        }

        void init_logging(boost::log::trivial::severity_level level) {
            boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
        }

    }    // namespace bus_mapping
}    // namespace zkwasm
