#pragma once
#include <allium/onion/config.hpp>

namespace allium { namespace onion {

    enum class dispatch_error
    {
        request_already_consumed = 1,
        connection_limit_reached,
        handshake_timeout,
        idle_timeout,
        transport_failed,
    };

    const error_category& dispatch_error_category();
    error_code make_error_code(dispatch_error code);
    error_condition make_error_condition(dispatch_error code);

    /// true if the error marks an orderly end of stream. A TLS peer that closes
    /// the transport without a close_notify counts as one.
    inline
    bool is_eof(const error_code& ec) {
        return ec == asio::error::misc_errors::eof
        or ec == ssl::error::stream_truncated;
    }

}}

namespace boost { namespace system {
    template<>
    struct is_error_code_enum<allium::onion::dispatch_error>
    : std::true_type {};
}}
