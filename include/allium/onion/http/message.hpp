#pragma once

#include <allium/onion/duplex_stream.hpp>
#include <allium/onion/exception.pb.h>
#include <allium/onion/http.pb.h>

#include <functional>
#include <string>

namespace allium { namespace onion { namespace http {

    /// One complete request read from a connection
    struct request
    {
        HttpRequestHeader header;
        std::string body;

        /// the peer asked to switch protocols (Connection: Upgrade or CONNECT)
        bool upgrade = false;

        /// the connection may carry another request after this one
        bool keep_alive = true;
    };

    /// Takes over a connection after a 101 response has been written. Receives
    /// the stream and any bytes the peer sent after the upgrade request.
    using upgrade_function = std::function<void(duplex_stream stream, std::string buffered)>;

    struct response
    {
        HttpResponseHeader header;
        std::string body;

        /// only consulted for a 101 response to an upgrade request
        upgrade_function upgrade;
    };

    /// A response with the given status, the standard reason phrase and
    /// optionally a body with its content type
    response make_response(int code,
                           std::string body = std::string(),
                           const std::string& content_type = "text/plain; charset=utf-8");

    /// A 101 response that switches to protocol and hands the connection to upgrade
    response make_upgrade_response(const std::string& protocol, upgrade_function upgrade);

    /// A 500 response carrying the report as json
    response make_exception_response(const Exception& report);

    int status_code(const response& r);

}}}
