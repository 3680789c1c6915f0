#pragma once

#include <allium/onion/config.hpp>
#include <allium/onion/memory_stream.hpp>
#include <allium/onion/transport_source.hpp>

#include <deque>
#include <mutex>

namespace allium { namespace onion {

    /// An in-process transport source. Requests are delivered in the order they
    /// were pushed. close() ends the sequence once the queued requests have been
    /// taken; fail() makes the transport fatal once they have been taken.
    ///
    /// push(), close() and fail() may be called from any thread.
    ///
    class queue_transport : public transport_source
    {
        using mutex_type = std::mutex;
        using lock_type = std::unique_lock<mutex_type>;

    public:
        queue_transport(executor_type executor, service_identity identity);

        /// Rejects whatever was never taken.
        ~queue_transport() override;

        /// Enqueue a request. A request pushed after close() or fail() is
        /// rejected immediately.
        void push(request_ptr request);

        void close();

        /// @pre ec must not be empty
        void fail(error_code ec);

        /// The number of requests pushed but not yet taken
        std::size_t pending() const;

        void async_next(next_handler handler) override;
        void cancel() override;
        service_identity identity() const override;

    private:
        lock_type get_lock() const { return lock_type(_mutex); }

        /// complete the waiting handler if there is anything to complete it with
        void deliver(lock_type lock);

        void post_completion(next_handler handler, error_code ec, request_ptr request);

        executor_type _executor;
        service_identity _identity;

        mutable mutex_type _mutex;
        std::deque<request_ptr> _queue;
        bool _closed = false;
        error_code _error;
        next_handler _waiting;
    };

    /// A stream request whose stream is one end of an in-memory connection.
    /// Accepting hands over the stream, rejecting closes it so that the other
    /// end sees eof.
    class memory_stream_request : public stream_request
    {
    public:
        memory_stream_request(request_descriptor descriptor, memory_stream stream);

    protected:
        void handle_accept(accept_handler handler) override;
        void handle_reject(error_code& ec) override;

    private:
        memory_stream _stream;
    };

}}
