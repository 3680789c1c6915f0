#pragma once

#include <allium/onion/config.hpp>
#include <allium/onion/duplex_stream.hpp>
#include <allium/onion/request_descriptor.hpp>

#include <functional>

namespace allium { namespace onion {

    /// One inbound logical connection attempt surfaced by an overlay transport.
    ///
    /// Exactly one of async_accept() or reject() may be called. A second call of
    /// either fails with dispatch_error::request_already_consumed. Destroying a
    /// request on which neither was called leaks the remote circuit and is
    /// reported in the log.
    ///
    class stream_request
    {
    public:
        using accept_handler = std::function<void(const error_code& ec, duplex_stream stream)>;

        explicit stream_request(request_descriptor descriptor);

        stream_request(const stream_request&) = delete;
        stream_request& operator=(const stream_request&) = delete;

        virtual ~stream_request();

        const request_descriptor& descriptor() const { return _descriptor; }

        /// Ask the transport for the raw stream. The handler is invoked once,
        /// never from within this call, with either the stream or the reason the
        /// transport could not produce it.
        /// @throws system_error if the request has already been consumed
        void async_accept(accept_handler handler);

        /// Close the remote circuit without transferring any data.
        void reject(error_code& ec);
        void reject();

        bool consumed() const noexcept { return _consumed; }

    protected:
        virtual void handle_accept(accept_handler handler) = 0;
        virtual void handle_reject(error_code& ec) = 0;

    private:
        bool consume(error_code& ec);

        request_descriptor _descriptor;
        bool _consumed = false;
    };

}}
