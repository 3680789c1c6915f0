#include <allium/onion/tls_terminator.hpp>
#include <allium/onion/errors.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <fstream>
#include <sstream>

namespace allium { namespace onion {

    std::shared_ptr<ssl::context> make_server_context(const std::string& certificate_chain_pem,
                                                      const std::string& private_key_pem)
    {
        auto context = std::make_shared<ssl::context>(ssl::context::tls_server);
        context->set_options(ssl::context::default_workarounds
                             | ssl::context::no_sslv2
                             | ssl::context::no_sslv3
                             | ssl::context::no_tlsv1
                             | ssl::context::single_dh_use);

        error_code ec;
        context->use_certificate_chain(asio::buffer(certificate_chain_pem), ec);
        if (ec)
            throw system_error(ec, "certificate chain");

        context->use_private_key(asio::buffer(private_key_pem), ssl::context::pem, ec);
        if (ec)
            throw system_error(ec, "private key");

        if (::SSL_CTX_check_private_key(context->native_handle()) != 1)
        {
            ec = error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category());
            throw system_error(ec, "private key does not match certificate");
        }
        return context;
    }

    namespace {
        std::string read_file(const std::string& path)
        {
            std::ifstream in(path, std::ios::binary);
            if (not in)
                throw system_error(errc::make_error_code(errc::no_such_file_or_directory),
                                   "cannot open " + path);
            std::ostringstream ss;
            ss << in.rdbuf();
            return ss.str();
        }
    }

    std::shared_ptr<ssl::context> load_server_context(const std::string& certificate_chain_file,
                                                      const std::string& private_key_file)
    {
        return make_server_context(read_file(certificate_chain_file),
                                   read_file(private_key_file));
    }

    namespace {

        /// The encrypted stream keeps the shared context alive for as long as
        /// it exists.
        class tls_stream
        {
        public:
            using stream_type = ssl::stream<duplex_stream>;
            using executor_type = stream_type::executor_type;
            using lowest_layer_type = stream_type::lowest_layer_type;

            tls_stream(std::shared_ptr<ssl::context> context, duplex_stream raw)
            : _context(std::move(context))
            , _stream(std::move(raw), *_context)
            {}

            stream_type& stream() { return _stream; }

            template<class MutableBufferSequence, class ReadHandler>
            void async_read_some(const MutableBufferSequence& buffers, ReadHandler&& handler)
            {
                _stream.async_read_some(buffers, std::forward<ReadHandler>(handler));
            }

            template<class ConstBufferSequence, class WriteHandler>
            void async_write_some(const ConstBufferSequence& buffers, WriteHandler&& handler)
            {
                _stream.async_write_some(buffers, std::forward<WriteHandler>(handler));
            }

            /// send close_notify, then wait for the peer's
            template<class ShutdownHandler>
            void async_shutdown(ShutdownHandler&& handler)
            {
                _stream.async_shutdown(std::forward<ShutdownHandler>(handler));
            }

            executor_type get_executor() { return _stream.get_executor(); }
            lowest_layer_type& lowest_layer() { return _stream.lowest_layer(); }

        private:
            std::shared_ptr<ssl::context> _context;
            stream_type _stream;
        };
    }

    struct tls_terminator::handshake_op : std::enable_shared_from_this<handshake_op>
    {
        handshake_op(std::shared_ptr<ssl::context> context,
                     duplex_stream raw,
                     handler_type handler)
        : _stream(std::make_unique<tls_stream>(std::move(context), std::move(raw)))
        , _strand(_stream->get_executor())
        , _timer(_strand)
        , _handler(std::move(handler))
        {
        }

        void start(std::chrono::milliseconds handshake_timeout)
        {
            ALLIUM_ONION_TRACE_METHOD("tls_terminator::handshake_op", __func__);
            if (handshake_timeout.count())
            {
                _timer.expires_after(handshake_timeout);
                _timer.async_wait(asio::bind_executor(_strand,
                                                      [self = shared_from_this()](const error_code& ec)
                                                      {
                                                          if (ec != asio::error::operation_aborted)
                                                              self->handle_timeout();
                                                      }));
            }
            _stream->stream().async_handshake(ssl::stream_base::server,
                                              asio::bind_executor(_strand,
                                                                  [self = shared_from_this()](const error_code& ec)
                                                                  {
                                                                      self->handle_handshake(ec);
                                                                  }));
        }

        void handle_timeout()
        {
            if (_done)
                return;
            _timed_out = true;
            error_code ignored;
            _stream->lowest_layer().close(ignored);
        }

        void handle_handshake(error_code ec)
        {
            ALLIUM_ONION_TRACE_METHOD_N("tls_terminator::handshake_op", __func__, ec.message());
            _done = true;
            _timer.cancel();
            if (_timed_out)
                ec = dispatch_error::handshake_timeout;

            auto handler = std::move(_handler);
            if (ec)
                handler(ec, duplex_stream());
            else
                handler(ec, duplex_stream(is_owner, std::move(_stream)));
        }

        std::unique_ptr<tls_stream> _stream;
        asio::strand<executor_type> _strand;
        asio::steady_timer _timer;
        handler_type _handler;
        bool _timed_out = false;
        bool _done = false;
    };

    tls_terminator::tls_terminator(std::shared_ptr<ssl::context> context)
    : _context(std::move(context))
    {
    }

    void tls_terminator::async_terminate(duplex_stream raw,
                                         std::chrono::milliseconds handshake_timeout,
                                         handler_type handler)
    {
        auto op = std::make_shared<handshake_op>(_context, std::move(raw), std::move(handler));
        op->start(handshake_timeout);
    }

}}
