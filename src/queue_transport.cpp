#include <allium/onion/queue_transport.hpp>
#include <allium/onion/sensitive.hpp>

namespace allium { namespace onion {

    queue_transport::queue_transport(executor_type executor, service_identity identity)
    : _executor(std::move(executor))
    , _identity(std::move(identity))
    {
    }

    queue_transport::~queue_transport()
    {
        for (auto& request : _queue)
        {
            error_code ec;
            request->reject(ec);
            if (ec)
                BOOST_LOG_TRIVIAL(debug) << "queue_transport: rejecting left over request: " << ec.message();
        }
    }

    void queue_transport::push(request_ptr request)
    {
        ALLIUM_ONION_TRACE_METHOD_N("queue_transport", __func__, sensitive(request->descriptor()));
        auto lock = get_lock();
        if (_closed or _error)
        {
            lock.unlock();
            BOOST_LOG_TRIVIAL(warning) << "queue_transport: request pushed after end of sequence";
            error_code ec;
            request->reject(ec);
            if (ec)
                BOOST_LOG_TRIVIAL(debug) << "queue_transport: reject failed: " << ec.message();
            return;
        }
        _queue.push_back(std::move(request));
        deliver(std::move(lock));
    }

    void queue_transport::close()
    {
        auto lock = get_lock();
        _closed = true;
        deliver(std::move(lock));
    }

    void queue_transport::fail(error_code ec)
    {
        auto lock = get_lock();
        if (not _error)
            _error = ec;
        deliver(std::move(lock));
    }

    std::size_t queue_transport::pending() const
    {
        auto lock = get_lock();
        return _queue.size();
    }

    void queue_transport::async_next(next_handler handler)
    {
        auto lock = get_lock();
        if (_waiting)
        {
            lock.unlock();
            post_completion(std::move(handler), asio::error::already_started, nullptr);
            return;
        }
        _waiting = std::move(handler);
        deliver(std::move(lock));
    }

    void queue_transport::cancel()
    {
        auto lock = get_lock();
        if (_waiting)
        {
            auto handler = std::move(_waiting);
            _waiting = nullptr;
            lock.unlock();
            post_completion(std::move(handler), asio::error::operation_aborted, nullptr);
        }
    }

    service_identity queue_transport::identity() const
    {
        return _identity;
    }

    void queue_transport::deliver(lock_type lock)
    {
        if (not _waiting)
            return;

        error_code ec;
        request_ptr request;
        if (not _queue.empty())
        {
            request = std::move(_queue.front());
            _queue.pop_front();
        }
        else if (_error)
        {
            ec = _error;
        }
        else if (not _closed)
        {
            return;
        }

        auto handler = std::move(_waiting);
        _waiting = nullptr;
        lock.unlock();
        post_completion(std::move(handler), ec, std::move(request));
    }

    void queue_transport::post_completion(next_handler handler, error_code ec, request_ptr request)
    {
        asio::post(_executor,
                   [handler = std::move(handler), ec, request = std::move(request)]() mutable
                   {
                       handler(ec, std::move(request));
                   });
    }

    //
    // memory_stream_request
    //

    memory_stream_request::memory_stream_request(request_descriptor descriptor, memory_stream stream)
    : stream_request(std::move(descriptor))
    , _stream(std::move(stream))
    {
    }

    void memory_stream_request::handle_accept(accept_handler handler)
    {
        auto executor = _stream.get_executor();
        asio::post(executor,
                   [handler = std::move(handler), stream = std::move(_stream)]() mutable
                   {
                       handler(error_code(), duplex_stream(is_owner, std::move(stream)));
                   });
    }

    void memory_stream_request::handle_reject(error_code& ec)
    {
        _stream.close(ec);
    }

}}
