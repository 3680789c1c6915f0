#pragma once

#include <allium/onion/service_config.pb.h>

namespace allium { namespace onion {

    /// Install the console sink and the severity filter, and switch safe
    /// logging according to the configuration. Call once, before any threads
    /// are started.
    /// @throws std::invalid_argument if the level is not a severity name
    void init_logging(const LoggingConfig& config);

}}
