#pragma once

#include <allium/onion/request_descriptor.hpp>

#include <cstdint>
#include <initializer_list>
#include <set>

namespace allium { namespace onion {

    /// Decides which stream requests are worth a TLS handshake. Only begin
    /// streams whose declared port is in the allow-set are admitted.
    struct port_gate
    {
        using port_set = std::set<std::uint16_t>;

        /// The allow-set for plain and secure HTTP: {80, 443}
        static port_set default_ports();

        port_gate();
        explicit port_gate(port_set allowed);
        port_gate(std::initializer_list<std::uint16_t> allowed);

        bool admit(const request_descriptor& descriptor) const noexcept;

        const port_set& allowed_ports() const { return _allowed; }

    private:
        port_set _allowed;
    };

}}
