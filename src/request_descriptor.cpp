#include <allium/onion/request_descriptor.hpp>

#include <ostream>
#include <tuple>

namespace allium { namespace onion {

    const char* to_string(stream_kind kind)
    {
        switch(kind)
        {
            case stream_kind::begin:
                return "begin";
            case stream_kind::begin_dir:
                return "begin_dir";
            case stream_kind::resolve:
                return "resolve";
        }
        return "unknown";
    }

    std::ostream& operator<<(std::ostream& os, stream_kind kind)
    {
        return os << to_string(kind);
    }

    bool operator==(const request_descriptor& l, const request_descriptor& r)
    {
        return std::tie(l.kind, l.port, l.address) == std::tie(r.kind, r.port, r.address);
    }

    bool operator!=(const request_descriptor& l, const request_descriptor& r)
    {
        return not (l == r);
    }

    std::ostream& operator<<(std::ostream& os, const request_descriptor& descriptor)
    {
        os << descriptor.kind << "{port=" << descriptor.port;
        if (not descriptor.address.empty())
            os << ", address=" << descriptor.address;
        return os << '}';
    }

}}
