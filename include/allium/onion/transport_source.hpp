#pragma once

#include <allium/onion/config.hpp>
#include <allium/onion/stream_request.hpp>

#include <functional>
#include <memory>
#include <string>

namespace allium { namespace onion {

    /// How the service is known to the outside world. Not secret.
    struct service_identity
    {
        std::string nickname;
        std::string name;
    };

    /// A lazy, ordered sequence of stream requests.
    ///
    /// async_next() completes with:
    /// - no error and a request: the next stream request
    /// - no error and a null request: the sequence has ended and no request will
    ///   ever arrive again
    /// - asio::error::operation_aborted: cancel() was called
    /// - any other error: the transport cannot continue
    ///
    /// Completions are never invoked from within async_next(). Only one
    /// async_next() may be outstanding at a time.
    struct transport_source
    {
        using request_ptr = std::unique_ptr<stream_request>;
        using next_handler = std::function<void(const error_code& ec, request_ptr request)>;

        virtual void async_next(next_handler handler) = 0;

        /// Complete an outstanding async_next() with operation_aborted.
        virtual void cancel() = 0;

        virtual service_identity identity() const = 0;

        virtual ~transport_source() = default;
    };

}}
