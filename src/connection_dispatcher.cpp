#include <allium/onion/connection_dispatcher.hpp>
#include <allium/onion/errors.hpp>
#include <allium/onion/sensitive.hpp>

namespace allium { namespace onion {

    connection_dispatcher::connection_dispatcher(executor_type executor,
                                                 std::shared_ptr<transport_source> source,
                                                 port_gate gate,
                                                 std::shared_ptr<terminator> stream_terminator,
                                                 std::shared_ptr<const http::request_handler> handler,
                                                 dispatcher_options options)
    : _executor(executor)
    , _strand(executor)
    , _source(std::move(source))
    , _gate(std::move(gate))
    , _options(options)
    , _stats(std::make_shared<dispatch_stats>())
    {
        auto env = std::make_shared<connection_environment>();
        env->stream_terminator = std::move(stream_terminator);
        env->handler = std::move(handler);
        env->handshake_timeout = _options.handshake_timeout;
        env->connection = _options.connection;
        env->stats = _stats;
        _env = std::move(env);
    }

    void connection_dispatcher::async_run(completion_handler handler)
    {
        ALLIUM_ONION_TRACE_METHOD("connection_dispatcher", __func__);
        asio::dispatch(_strand, [self = shared_from_this(), handler = std::move(handler)]() mutable
        {
            if (self->_started)
            {
                asio::post(self->_executor, [handler = std::move(handler)]
                {
                    handler(asio::error::already_started);
                });
                return;
            }
            self->_started = true;
            self->_completion = std::move(handler);

            if (self->_cancelled)
            {
                self->complete(asio::error::operation_aborted);
                return;
            }

            BOOST_LOG_TRIVIAL(info) << "dispatching "
            << self->_env->stream_terminator->name() << " connections";
            self->pull_next();
        });
    }

    void connection_dispatcher::cancel()
    {
        asio::dispatch(_strand, [self = shared_from_this()]
        {
            if (self->_cancelled)
                return;
            self->_cancelled = true;
            self->_source->cancel();
        });
    }

    void connection_dispatcher::pull_next()
    {
        auto self = shared_from_this();
        _source->async_next([self](const error_code& ec, transport_source::request_ptr request)
        {
            asio::dispatch(self->_strand,
                           [self, ec, request = std::move(request)]() mutable
                           {
                               self->handle_next(ec, std::move(request));
                           });
        });
    }

    void connection_dispatcher::handle_next(const error_code& ec,
                                            transport_source::request_ptr request)
    {
        ALLIUM_ONION_TRACE_METHOD_N("connection_dispatcher", __func__, ec.message());

        if (_cancelled)
        {
            if (request)
                reject(*request, "dispatcher cancelled");
            complete(asio::error::operation_aborted);
            return;
        }

        if (ec == asio::error::operation_aborted)
        {
            complete(ec);
            return;
        }

        if (ec)
        {
            BOOST_LOG_TRIVIAL(error) << "transport " << _source->identity().nickname
            << " failed: " << ec.message() << " (" << ec.category().name() << ":" << ec.value() << ")";
            complete(dispatch_error::transport_failed);
            return;
        }

        if (not request)
        {
            BOOST_LOG_TRIVIAL(info) << "no more stream requests";
            complete(error_code());
            return;
        }

        ++_stats->received;
        BOOST_LOG_TRIVIAL(info) << "received connection";

        if (not _gate.admit(request->descriptor()))
        {
            reject(*request, "port not served");
        }
        else if (_options.max_connections
                 and _stats->active.load() >= _options.max_connections)
        {
            reject(*request, make_error_code(dispatch_error::connection_limit_reached).message());
        }
        else
        {
            accept(std::move(request));
        }

        pull_next();
    }

    void connection_dispatcher::reject(stream_request& request, const std::string& reason)
    {
        BOOST_LOG_TRIVIAL(info) << "rejecting request " << sensitive(request.descriptor())
        << ": " << reason;

        ++_stats->rejected;
        error_code ec;
        request.reject(ec);
        if (ec)
        {
            ++_stats->reject_failed;
            BOOST_LOG_TRIVIAL(warning) << "reject of " << sensitive(request.descriptor())
            << " failed: " << ec.message();
        }
    }

    void connection_dispatcher::accept(transport_source::request_ptr request)
    {
        ++_stats->active;

        auto id = connection_id(connection_id::generate);
        std::shared_ptr<stream_request> shared_request = std::move(request);

        BOOST_LOG_TRIVIAL(debug) << "connection " << id << ": accepting " << sensitive(shared_request->descriptor());

        shared_request->async_accept([env = _env, id, shared_request]
                                     (const error_code& ec, duplex_stream stream)
        {
            if (ec)
            {
                ++env->stats->accept_failed;
                --env->stats->active;
                BOOST_LOG_TRIVIAL(warning) << "connection " << id << " failed in stage accept for "
                << sensitive(shared_request->descriptor()) << ": " << ec.message();
                return;
            }

            ++env->stats->accepted;
            auto task = std::make_shared<connection_task>(env,
                                                          id,
                                                          shared_request->descriptor(),
                                                          std::move(stream));
            task->start();
        });
    }

    void connection_dispatcher::complete(error_code ec)
    {
        BOOST_LOG_TRIVIAL(info) << "dispatcher finished: " << (ec ? ec.message() : "end of sequence")
        << " " << *_stats;

        auto handler = std::move(_completion);
        _completion = nullptr;
        if (handler)
            asio::post(_executor, [handler = std::move(handler), ec]
            {
                handler(ec);
            });
    }

}}
