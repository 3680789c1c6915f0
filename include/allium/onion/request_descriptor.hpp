#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>

namespace allium { namespace onion {

    /// The kind of stream a remote peer asked the overlay to open.
    enum class stream_kind
    {
        begin,          ///< a data stream to a virtual port of the service
        begin_dir,      ///< a directory stream
        resolve,        ///< a hostname lookup
    };

    const char* to_string(stream_kind kind);
    std::ostream& operator<<(std::ostream& os, stream_kind kind);

    /// What a stream request says about itself. Only a begin stream carries a
    /// meaningful destination port.
    struct request_descriptor
    {
        stream_kind kind = stream_kind::begin;
        std::uint16_t port = 0;
        std::string address;
    };

    inline
    request_descriptor begin_stream(std::uint16_t port, std::string address = std::string())
    {
        return request_descriptor { stream_kind::begin, port, std::move(address) };
    }

    bool operator==(const request_descriptor& l, const request_descriptor& r);
    bool operator!=(const request_descriptor& l, const request_descriptor& r);

    /// Prints the whole descriptor. Wrap it in sensitive() before logging.
    std::ostream& operator<<(std::ostream& os, const request_descriptor& descriptor);

}}
