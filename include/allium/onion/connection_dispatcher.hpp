#pragma once

#include <allium/onion/config.hpp>
#include <allium/onion/connection_task.hpp>
#include <allium/onion/dispatch_stats.hpp>
#include <allium/onion/http/request_handler.hpp>
#include <allium/onion/http/server_connection.hpp>
#include <allium/onion/port_gate.hpp>
#include <allium/onion/terminator.hpp>
#include <allium/onion/transport_source.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace allium { namespace onion {

    struct dispatcher_options
    {
        /// zero means no deadline
        std::chrono::milliseconds handshake_timeout { 30000 };

        /// admitted requests beyond this many live connections are rejected.
        /// zero means no limit
        std::size_t max_connections = 0;

        http::connection_options connection;
    };

    /// The accept loop.
    ///
    /// Pulls stream requests from the transport one at a time, in order. Each
    /// request is either rejected on the spot or accepted and handed to a
    /// connection_task that runs on its own. The loop never waits for a task,
    /// and no task's failure reaches the loop.
    ///
    /// Must be owned by a shared_ptr.
    ///
    class connection_dispatcher : public std::enable_shared_from_this<connection_dispatcher>
    {
    public:
        using completion_handler = std::function<void(const error_code& ec)>;

        connection_dispatcher(executor_type executor,
                              std::shared_ptr<transport_source> source,
                              port_gate gate,
                              std::shared_ptr<terminator> stream_terminator,
                              std::shared_ptr<const http::request_handler> handler,
                              dispatcher_options options = dispatcher_options());

        connection_dispatcher(const connection_dispatcher&) = delete;
        connection_dispatcher& operator=(const connection_dispatcher&) = delete;

        /// Run until the transport's sequence ends. The handler is called once,
        /// never from within this call, with:
        /// - no error when the sequence ended
        /// - asio::error::operation_aborted after cancel()
        /// - dispatch_error::transport_failed when the transport cannot continue.
        ///   The transport's own error is logged
        /// - asio::error::already_started if the dispatcher was already run
        ///
        /// Connection tasks still running when the handler is called carry on.
        void async_run(completion_handler handler);

        /// Stop pulling requests. May be called from any thread.
        void cancel();

        const dispatch_stats& stats() const { return *_stats; }

    private:
        void pull_next();
        void handle_next(const error_code& ec, transport_source::request_ptr request);

        void reject(stream_request& request, const std::string& reason);
        void accept(transport_source::request_ptr request);

        void complete(error_code ec);

        executor_type _executor;
        asio::strand<executor_type> _strand;
        std::shared_ptr<transport_source> _source;
        port_gate _gate;
        dispatcher_options _options;
        std::shared_ptr<dispatch_stats> _stats;
        std::shared_ptr<const connection_environment> _env;

        bool _started = false;
        bool _cancelled = false;
        completion_handler _completion;
    };

}}
