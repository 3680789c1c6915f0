#include <allium/onion/port_gate.hpp>

namespace allium { namespace onion {

    auto port_gate::default_ports() -> port_set
    {
        return port_set { 80, 443 };
    }

    port_gate::port_gate()
    : _allowed(default_ports())
    {}

    port_gate::port_gate(port_set allowed)
    : _allowed(std::move(allowed))
    {}

    port_gate::port_gate(std::initializer_list<std::uint16_t> allowed)
    : _allowed(allowed)
    {}

    bool port_gate::admit(const request_descriptor& descriptor) const noexcept
    {
        if (descriptor.kind != stream_kind::begin)
            return false;
        return _allowed.count(descriptor.port) != 0;
    }

}}
