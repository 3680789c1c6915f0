#pragma once

#include <allium/onion/config.hpp>
#include <allium/onion/duplex_stream.hpp>

#include <chrono>
#include <functional>

namespace allium { namespace onion {

    /// Turns a raw stream accepted from the transport into the stream the
    /// HTTP bridge serves.
    struct terminator
    {
        using handler_type = std::function<void(const error_code& ec, duplex_stream stream)>;

        /// Consume raw and complete with the prepared stream. On failure the
        /// handler receives the error and an empty stream. The handler is never
        /// invoked from within this call.
        /// @param handshake_timeout zero means no deadline
        virtual void async_terminate(duplex_stream raw,
                                     std::chrono::milliseconds handshake_timeout,
                                     handler_type handler) = 0;

        /// for the logs
        virtual const char* name() const = 0;

        virtual ~terminator() = default;
    };

    /// Hands the raw stream straight through, for transports that already
    /// encrypt end to end.
    struct plain_terminator : terminator
    {
        void async_terminate(duplex_stream raw,
                             std::chrono::milliseconds handshake_timeout,
                             handler_type handler) override;

        const char* name() const override { return "plain"; }
    };

}}
