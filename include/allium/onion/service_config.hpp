#pragma once

#include <allium/onion/service_config.pb.h>

#include <allium/onion/connection_dispatcher.hpp>
#include <allium/onion/port_gate.hpp>
#include <allium/onion/tcp_transport.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace allium { namespace onion {

    /// The configuration cannot be used. The message names the offending field.
    struct invalid_config : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    static constexpr auto default_nickname = "allium-ampeloprasum";

    /// Fill in every field the document left out.
    void apply_defaults(ServiceConfig& config);

    /// @throws invalid_config
    void validate(const ServiceConfig& config);

    /// An empty document gives the defaults.
    /// @throws invalid_config if the document is not a ServiceConfig or fails
    /// validation
    ServiceConfig parse_service_config(const std::string& json);

    /// @throws invalid_config
    ServiceConfig load_service_config(const std::string& path);

    port_gate make_port_gate(const ServiceConfig& config);
    dispatcher_options make_dispatcher_options(const ServiceConfig& config);

    /// @throws invalid_config if a listen address is not an ip address
    std::vector<forwarded_port> make_forwarded_ports(const ServiceConfig& config);

}}
