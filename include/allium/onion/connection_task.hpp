#pragma once

#include <allium/onion/config.hpp>
#include <allium/onion/dispatch_stats.hpp>
#include <allium/onion/duplex_stream.hpp>
#include <allium/onion/http/request_handler.hpp>
#include <allium/onion/http/server_connection.hpp>
#include <allium/onion/identifiers.hpp>
#include <allium/onion/request_descriptor.hpp>
#include <allium/onion/terminator.hpp>

#include <chrono>
#include <memory>

namespace allium { namespace onion {

    /// Everything a connection task shares with its siblings. Read only once
    /// the dispatcher has started, apart from the counters.
    struct connection_environment
    {
        std::shared_ptr<terminator> stream_terminator;
        std::shared_ptr<const http::request_handler> handler;
        std::chrono::milliseconds handshake_timeout { 0 };
        http::connection_options connection;
        std::shared_ptr<dispatch_stats> stats;
    };

    /// Runs one accepted connection through termination and HTTP serving.
    ///
    /// A task owns its stream exclusively and keeps itself alive until serving
    /// ends. Whatever goes wrong is logged and counted here; nothing is
    /// reported to the dispatcher.
    ///
    /// The task counts as active from construction until destruction.
    ///
    class connection_task : public std::enable_shared_from_this<connection_task>
    {
    public:
        connection_task(std::shared_ptr<const connection_environment> env,
                        connection_id id,
                        request_descriptor descriptor,
                        duplex_stream raw);

        connection_task(const connection_task&) = delete;
        connection_task& operator=(const connection_task&) = delete;

        ~connection_task();

        void start();

        const connection_id& id() const { return _id; }

    private:
        void handle_terminated(const error_code& ec, duplex_stream stream);
        void handle_served(const error_code& ec, std::size_t requests_served);

        /// log a failure in the named stage
        void report(const char* stage, const error_code& ec);

        std::shared_ptr<const connection_environment> _env;
        connection_id _id;
        request_descriptor _descriptor;
        duplex_stream _raw;
    };

}}
