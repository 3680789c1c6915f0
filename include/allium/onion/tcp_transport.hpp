#pragma once

#include <allium/onion/config.hpp>
#include <allium/onion/transport_source.hpp>

#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace allium { namespace onion {

    /// One virtual port of the onion service, and the local listener the overlay
    /// daemon forwards it to.
    struct forwarded_port
    {
        std::uint16_t virtual_port = 0;
        asio::ip::tcp::endpoint endpoint;
    };

    /// Read the service's reachable name from the daemon's hostname file.
    /// @returns the trimmed first line, or an empty string if the file cannot be
    /// read
    std::string read_hostname_file(const std::string& path);

    /// A transport source fed by local TCP listeners. The overlay daemon forwards
    /// each virtual port of the service to one of them, so every accepted
    /// connection becomes a begin stream request for that virtual port.
    ///
    /// Must be owned by a shared_ptr.
    ///
    class tcp_transport
    : public transport_source
    , public std::enable_shared_from_this<tcp_transport>
    {
        struct listener;

    public:
        tcp_transport(executor_type executor,
                      std::vector<forwarded_port> ports,
                      service_identity identity);

        ~tcp_transport() override;

        /// Bind and listen on every forwarded port and start accepting.
        /// @throws system_error
        void listen();

        /// The bound endpoints, in the order of the forwarded ports. Meaningful
        /// once listen() has returned. A port given as 0 shows the port the
        /// system chose.
        std::vector<forwarded_port> local_endpoints() const;

        /// Stop listening. The sequence ends once the connections already
        /// accepted have been taken.
        void close();

        void async_next(next_handler handler) override;
        void cancel() override;
        service_identity identity() const override;

    private:
        void accept_next(listener& l);
        void handle_accept(listener& l, const error_code& ec, asio::ip::tcp::socket socket);
        void close_listeners();
        void deliver();
        void post_completion(next_handler handler, error_code ec, request_ptr request);

        executor_type _executor;
        asio::strand<executor_type> _strand;
        std::vector<forwarded_port> _ports;
        service_identity _identity;

        std::vector<std::unique_ptr<listener>> _listeners;
        std::vector<forwarded_port> _bound;

        // state below is only touched on the strand
        std::deque<request_ptr> _queue;
        next_handler _waiting;
        bool _closed = false;
        error_code _error;
    };

    /// A connection the overlay daemon made to one of the local listeners.
    class tcp_stream_request : public stream_request
    {
    public:
        tcp_stream_request(request_descriptor descriptor, asio::ip::tcp::socket socket);

    protected:
        void handle_accept(accept_handler handler) override;
        void handle_reject(error_code& ec) override;

    private:
        asio::ip::tcp::socket _socket;
    };

}}
