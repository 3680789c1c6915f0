#include <allium/onion/connection_task.hpp>
#include <allium/onion/sensitive.hpp>

namespace allium { namespace onion {

    connection_task::connection_task(std::shared_ptr<const connection_environment> env,
                                     connection_id id,
                                     request_descriptor descriptor,
                                     duplex_stream raw)
    : _env(std::move(env))
    , _id(std::move(id))
    , _descriptor(std::move(descriptor))
    , _raw(std::move(raw))
    {
    }

    connection_task::~connection_task()
    {
        --_env->stats->active;
    }

    void connection_task::start()
    {
        ALLIUM_ONION_TRACE_METHOD_N("connection_task", __func__, _id);
        BOOST_LOG_TRIVIAL(debug) << "connection " << _id << ": " << _env->stream_terminator->name()
        << " termination";

        _env->stream_terminator->async_terminate(std::move(_raw),
                                                 _env->handshake_timeout,
                                                 [self = shared_from_this()]
                                                 (const error_code& ec, duplex_stream stream)
                                                 {
                                                     self->handle_terminated(ec, std::move(stream));
                                                 });
    }

    void connection_task::handle_terminated(const error_code& ec, duplex_stream stream)
    {
        ALLIUM_ONION_TRACE_METHOD_N("connection_task", __func__, _id, ec.message());
        if (ec)
        {
            ++_env->stats->handshake_failed;
            report("handshake", ec);
            return;
        }

        auto connection = std::make_shared<http::server_connection>(std::move(stream),
                                                                    _env->handler,
                                                                    _env->connection);
        // the connection holds the completion, the completion holds the task
        auto weak_connection = std::weak_ptr<http::server_connection>(connection);
        connection->async_serve([self = shared_from_this(), weak_connection](const error_code& ec)
        {
            auto connection = weak_connection.lock();
            self->handle_served(ec, connection ? connection->requests_served() : 0);
        });
    }

    void connection_task::handle_served(const error_code& ec, std::size_t requests_served)
    {
        ALLIUM_ONION_TRACE_METHOD_N("connection_task", __func__, _id, ec.message());
        if (ec)
        {
            ++_env->stats->serve_failed;
            report("serve", ec);
            return;
        }

        ++_env->stats->served;
        BOOST_LOG_TRIVIAL(info) << "connection " << _id << " closed after "
        << requests_served << " request(s)";
    }

    void connection_task::report(const char* stage, const error_code& ec)
    {
        BOOST_LOG_TRIVIAL(warning) << "connection " << _id << " failed in stage " << stage
        << " for " << sensitive(_descriptor) << ": " << ec.message();
    }

}}
