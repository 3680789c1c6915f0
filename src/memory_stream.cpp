#include <allium/onion/memory_stream.hpp>

namespace allium { namespace onion {

    // memory_pipe implementation

    memory_pipe::memory_pipe(executor_type reader_executor)
    : _reader_executor(std::move(reader_executor))
    , _consume_op { nullptr }
    {
    }

    void memory_pipe::flush_to_op(lock_type lock)
    {
        if (not _consume_op)
            return;

        auto data = _bytes.data();
        if (asio::buffer_size(data))
        {
            auto consumed = _consume_op->consume(lock, data);
            _bytes.consume(consumed);
            auto op = std::move(_consume_op);
            op->commit(std::move(lock));
        }
        else if (_read_error)
        {
            _consume_op->set_error(lock, _read_error);
            auto op = std::move(_consume_op);
            op->commit(std::move(lock));
        }
    }

    void memory_pipe::abort_op(lock_type lock, error_code ec)
    {
        if (_consume_op) {
            _consume_op->set_error(lock, ec);
            auto op = std::move(_consume_op);
            op->commit(std::move(lock));
        }
    }

    void memory_pipe::close_writer()
    {
        auto lock = get_lock();
        if (not _read_error)
            _read_error = asio::error::misc_errors::eof;
        if (not _write_error)
            _write_error = asio::error::shut_down;
        flush_to_op(std::move(lock));
    }

    void memory_pipe::close_reader()
    {
        auto lock = get_lock();
        _bytes.consume(_bytes.size());
        _read_error = asio::error::bad_descriptor;
        if (not _write_error)
            _write_error = asio::error::broken_pipe;
        abort_op(std::move(lock), asio::error::operation_aborted);
    }

    void memory_pipe::set_error(error_code ec)
    {
        auto lock = get_lock();
        _read_error = ec;
        _write_error = ec;
        flush_to_op(std::move(lock));
    }

    void memory_pipe::cancel() noexcept
    {
        auto lock = get_lock();
        abort_op(std::move(lock), asio::error::operation_aborted);
    }

    std::size_t memory_pipe::available()
    {
        auto lock = get_lock();
        return _bytes.size();
    }

    // memory_stream implementation

    memory_stream::memory_stream(executor_type executor,
                                 std::shared_ptr<memory_pipe> inbound,
                                 std::shared_ptr<memory_pipe> outbound)
    : _executor(std::move(executor))
    , _inbound(std::move(inbound))
    , _outbound(std::move(outbound))
    {
    }

    memory_stream& memory_stream::operator=(memory_stream&& other)
    {
        if (this != std::addressof(other))
        {
            error_code ignored;
            close(ignored);
            _executor = std::move(other._executor);
            _inbound = std::move(other._inbound);
            _outbound = std::move(other._outbound);
        }
        return *this;
    }

    memory_stream::~memory_stream() noexcept
    {
        error_code ignored;
        close(ignored);
    }

    void memory_stream::close(error_code& ec)
    {
        if (not _inbound)
        {
            ec = asio::error::bad_descriptor;
            return;
        }
        _outbound->close_writer();
        _inbound->close_reader();
        _outbound.reset();
        _inbound.reset();
        ec.clear();
    }

    void memory_stream::close()
    {
        error_code ec;
        close(ec);
        if (ec) throw system_error(ec, "close");
    }

    void memory_stream::cancel(error_code& ec)
    {
        if (not _inbound)
        {
            ec = asio::error::bad_descriptor;
            return;
        }
        _inbound->cancel();
        ec.clear();
    }

    void memory_stream::shutdown(asio::socket_base::shutdown_type what, error_code& ec)
    {
        if (not _inbound)
        {
            ec = asio::error::bad_descriptor;
            return;
        }
        if (what == asio::socket_base::shutdown_send or what == asio::socket_base::shutdown_both)
            _outbound->close_writer();
        if (what == asio::socket_base::shutdown_receive or what == asio::socket_base::shutdown_both)
            _inbound->close_reader();
        ec.clear();
    }

    std::pair<memory_stream, memory_stream>
    make_memory_stream_pair(executor_type first_executor, executor_type second_executor)
    {
        auto first_to_second = std::make_shared<memory_pipe>(second_executor);
        auto second_to_first = std::make_shared<memory_pipe>(first_executor);
        return std::make_pair(memory_stream(std::move(first_executor), second_to_first, first_to_second),
                              memory_stream(std::move(second_executor), first_to_second, second_to_first));
    }

}}
