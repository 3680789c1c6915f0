#pragma once

#include <allium/onion/config.hpp>

#include <memory>
#include <mutex>
#include <utility>

namespace allium { namespace onion {

    /// One direction of an in-memory connection. Bytes written are buffered
    /// without limit until the reader collects them.
    ///
    class memory_pipe
    {
        using mutex_type = std::mutex;
        using lock_type = std::unique_lock<mutex_type>;
        using data_type = asio::streambuf::const_buffers_type;

        struct consume_op
        {
            /// Copy as much of the buffered data as fits into the reader's buffers
            /// @returns the number of bytes copied
            virtual std::size_t consume(const lock_type& lock, const data_type& data) = 0;

            /// Inform the op that the pipe is in error.
            virtual void set_error(const lock_type& lock, error_code ec) = 0;

            /// Transfers are complete. The op must now complete the outstanding read.
            virtual void commit(lock_type lock) = 0;

            virtual ~consume_op() = default;
        };

        using consume_op_ptr = std::unique_ptr<consume_op>;

        template<class Handler, class MutableBufferSequence>
        struct async_read_op;

    public:
        /// @param  reader_executor is the executor on which reads complete
        explicit memory_pipe(executor_type reader_executor);

        ~memory_pipe() noexcept {
            cancel();
        }

        /// Buffer some data, possibly completing an outstanding read.
        /// Never blocks for longer than it takes to copy the bytes.
        template<class ConstBufferSequence>
        std::size_t write_some(const ConstBufferSequence& buffers, error_code& ec)
        {
            auto lock = get_lock();
            if (_write_error)
            {
                ec = _write_error;
                return 0;
            }

            auto copied = asio::buffer_copy(_bytes.prepare(asio::buffer_size(buffers)),
                                            buffers);
            _bytes.commit(copied);
            ec.clear();
            flush_to_op(std::move(lock));
            return copied;
        }

        template<class MutableBufferSequence, class ReadHandler>
        void async_read_some(const MutableBufferSequence& buffers, ReadHandler&& handler);

        /// The writer has finished. The reader sees eof once the buffered bytes
        /// are drained.
        void close_writer();

        /// The reader has gone away. A pending read is aborted, buffered bytes are
        /// discarded and further writes fail with broken_pipe.
        void close_reader();

        /// Fail the pipe in both directions. Any outstanding read completes with ec.
        /// @pre ec must not be empty
        void set_error(error_code ec);

        /// Cancel an outstanding read
        void cancel() noexcept;

        /// The number of bytes written but not yet read
        std::size_t available();

    private:
        lock_type get_lock() { return lock_type(_mutex); }

        void flush_to_op(lock_type lock);
        void abort_op(lock_type lock, error_code ec);

        executor_type _reader_executor;
        error_code _read_error;
        error_code _write_error;
        asio::streambuf _bytes;
        consume_op_ptr _consume_op;
        mutex_type _mutex;
    };

    template<class Handler, class MutableBufferSequence>
    struct memory_pipe::async_read_op : memory_pipe::consume_op
    {
        async_read_op(executor_type executor, MutableBufferSequence buffers, Handler handler)
        : _executor(std::move(executor))
        , _buffers(std::move(buffers))
        , _handler(std::move(handler))
        {
        }

        std::size_t consume(const lock_type&, const data_type& data) override
        {
            _count = asio::buffer_copy(_buffers, data);
            return _count;
        }

        void set_error(const lock_type&, error_code ec) override
        {
            _error = ec;
        }

        void commit(lock_type lock) override
        {
            lock.unlock();
            asio::post(_executor,
                       [handler = std::move(_handler), ec = _error, size = _count]() mutable
                       {
                           handler(ec, size);
                       });
        }

        executor_type _executor;
        MutableBufferSequence _buffers;
        Handler _handler;
        error_code _error;
        std::size_t _count = 0;
    };

    template<class MutableBufferSequence, class ReadHandler>
    void memory_pipe::async_read_some(const MutableBufferSequence& buffers,
                                      ReadHandler&& handler)
    {
        using buffer_sequence_type = std::decay_t<MutableBufferSequence>;
        using handler_type = std::decay_t<ReadHandler>;
        using op_type = async_read_op<handler_type, buffer_sequence_type>;

        auto op = std::make_unique<op_type>(_reader_executor,
                                            buffers,
                                            handler_type(std::forward<ReadHandler>(handler)));

        auto lock = get_lock();
        if (_consume_op)
        {
            op->set_error(lock, asio::error::already_started);
            op->commit(std::move(lock));
        }
        else if (asio::buffer_size(buffers) == 0)
        {
            op->commit(std::move(lock));
        }
        else
        {
            _consume_op = std::move(op);
            flush_to_op(std::move(lock));
        }
    }

    /// One end of an in-memory connection.
    ///
    /// @note   It models:
    ///         AsyncReadStream
    ///         AsyncWriteStream
    ///         SyncWriteStream
    /// and has the socket-like members close(), cancel(), shutdown() and
    /// lowest_layer() so that it can be wrapped in a duplex_stream or used as the
    /// next layer of an asio::ssl::stream.
    ///
    class memory_stream
    {
    public:
        using executor_type = onion::executor_type;
        using lowest_layer_type = memory_stream;

        memory_stream(executor_type executor,
                      std::shared_ptr<memory_pipe> inbound,
                      std::shared_ptr<memory_pipe> outbound);

        memory_stream(memory_stream&& other) = default;
        memory_stream& operator=(memory_stream&& other);

        /// Closes the stream. The peer sees eof.
        ~memory_stream() noexcept;

        executor_type get_executor() { return _executor; }

        lowest_layer_type& lowest_layer() { return *this; }
        const lowest_layer_type& lowest_layer() const { return *this; }

        template<class MutableBufferSequence, class ReadHandler>
        void async_read_some(const MutableBufferSequence& buffers, ReadHandler&& handler)
        {
            if (not _inbound)
            {
                post_completion(asio::error::bad_descriptor, 0, std::forward<ReadHandler>(handler));
                return;
            }
            _inbound->async_read_some(buffers, std::forward<ReadHandler>(handler));
        }

        template<class ConstBufferSequence>
        std::size_t write_some(const ConstBufferSequence& buffers, error_code& ec)
        {
            if (not _outbound)
            {
                ec = asio::error::bad_descriptor;
                return 0;
            }
            return _outbound->write_some(buffers, ec);
        }

        template<class ConstBufferSequence>
        std::size_t write_some(const ConstBufferSequence& buffers)
        {
            error_code ec;
            auto s = write_some(buffers, ec);
            if (ec) throw system_error(ec, "write_some");
            return s;
        }

        template<class ConstBufferSequence, class WriteHandler>
        void async_write_some(const ConstBufferSequence& buffers, WriteHandler&& handler)
        {
            error_code ec;
            auto written = write_some(buffers, ec);
            post_completion(ec, written, std::forward<WriteHandler>(handler));
        }

        void close(error_code& ec);
        void close();

        /// Cancel an outstanding read
        void cancel(error_code& ec);

        void shutdown(asio::socket_base::shutdown_type what, error_code& ec);

        bool is_open() const { return bool(_inbound); }

    private:
        template<class Handler>
        void post_completion(error_code ec, std::size_t size, Handler&& handler)
        {
            asio::post(_executor,
                       [ec, size, handler = std::decay_t<Handler>(std::forward<Handler>(handler))]() mutable
                       {
                           handler(ec, size);
                       });
        }

        executor_type _executor;
        std::shared_ptr<memory_pipe> _inbound;
        std::shared_ptr<memory_pipe> _outbound;
    };

    /// Create two connected endpoints. Bytes written to one are read from the
    /// other. Each endpoint completes its operations on its own executor.
    std::pair<memory_stream, memory_stream>
    make_memory_stream_pair(executor_type first_executor, executor_type second_executor);

    inline
    std::pair<memory_stream, memory_stream>
    make_memory_stream_pair(executor_type executor)
    {
        return make_memory_stream_pair(executor, executor);
    }

}}
