#include <allium/onion/tcp_transport.hpp>
#include <allium/onion/sensitive.hpp>

#include <boost/algorithm/string/trim.hpp>

#include <fstream>

namespace allium { namespace onion {

    std::string read_hostname_file(const std::string& path)
    {
        std::ifstream in(path);
        std::string line;
        if (not in or not std::getline(in, line))
            return std::string();
        boost::algorithm::trim(line);
        return line;
    }

    struct tcp_transport::listener
    {
        listener(executor_type executor, forwarded_port port)
        : port(std::move(port))
        , acceptor(std::move(executor))
        {}

        forwarded_port port;
        asio::ip::tcp::acceptor acceptor;
    };

    tcp_transport::tcp_transport(executor_type executor,
                                 std::vector<forwarded_port> ports,
                                 service_identity identity)
    : _executor(executor)
    , _strand(executor)
    , _ports(std::move(ports))
    , _identity(std::move(identity))
    {
    }

    tcp_transport::~tcp_transport()
    {
        for (auto& request : _queue)
        {
            error_code ec;
            request->reject(ec);
            if (ec)
                BOOST_LOG_TRIVIAL(debug) << "tcp_transport: rejecting left over request: " << ec.message();
        }
    }

    void tcp_transport::listen()
    {
        using asio::ip::tcp;

        for (auto& port : _ports)
        {
            auto l = std::make_unique<listener>(_executor, port);
            l->acceptor.open(port.endpoint.protocol());
            l->acceptor.set_option(tcp::acceptor::reuse_address(true));
            l->acceptor.bind(port.endpoint);
            l->acceptor.listen();

            auto bound = forwarded_port { port.virtual_port, l->acceptor.local_endpoint() };
            BOOST_LOG_TRIVIAL(info) << "forwarding virtual port " << bound.virtual_port
            << " from " << bound.endpoint;
            _bound.push_back(bound);
            _listeners.push_back(std::move(l));
        }

        asio::dispatch(_strand, [self = shared_from_this()]
        {
            for (auto& l : self->_listeners)
                self->accept_next(*l);
        });
    }

    std::vector<forwarded_port> tcp_transport::local_endpoints() const
    {
        return _bound;
    }

    void tcp_transport::close()
    {
        asio::dispatch(_strand, [self = shared_from_this()]
        {
            if (self->_closed)
                return;
            self->_closed = true;
            self->close_listeners();
            self->deliver();
        });
    }

    void tcp_transport::async_next(next_handler handler)
    {
        asio::dispatch(_strand, [self = shared_from_this(), handler = std::move(handler)]() mutable
        {
            if (self->_waiting)
            {
                self->post_completion(std::move(handler), asio::error::already_started, nullptr);
                return;
            }
            self->_waiting = std::move(handler);
            self->deliver();
        });
    }

    void tcp_transport::cancel()
    {
        asio::dispatch(_strand, [self = shared_from_this()]
        {
            if (not self->_waiting)
                return;
            auto handler = std::move(self->_waiting);
            self->_waiting = nullptr;
            self->post_completion(std::move(handler), asio::error::operation_aborted, nullptr);
        });
    }

    service_identity tcp_transport::identity() const
    {
        return _identity;
    }

    void tcp_transport::accept_next(listener& l)
    {
        l.acceptor.async_accept(_executor,
                                asio::bind_executor(_strand,
                                                    [self = shared_from_this(), &l]
                                                    (const error_code& ec, asio::ip::tcp::socket socket)
                                                    {
                                                        self->handle_accept(l, ec, std::move(socket));
                                                    }));
    }

    void tcp_transport::handle_accept(listener& l, const error_code& ec, asio::ip::tcp::socket socket)
    {
        ALLIUM_ONION_TRACE_METHOD_N("tcp_transport", __func__, l.port.virtual_port, ec.message());

        if (_closed or _error or ec == asio::error::operation_aborted)
            return;

        if (ec == asio::error::connection_aborted or ec == asio::error::connection_reset)
        {
            BOOST_LOG_TRIVIAL(debug) << "tcp_transport: peer went away during accept: " << ec.message();
            accept_next(l);
            return;
        }

        if (ec)
        {
            BOOST_LOG_TRIVIAL(error) << "tcp_transport: listener for virtual port " << l.port.virtual_port
            << " failed: " << ec.message();
            _error = ec;
            close_listeners();
            deliver();
            return;
        }

        auto descriptor = begin_stream(l.port.virtual_port, _identity.name);
        _queue.push_back(std::make_unique<tcp_stream_request>(std::move(descriptor), std::move(socket)));
        deliver();
        accept_next(l);
    }

    void tcp_transport::close_listeners()
    {
        for (auto& l : _listeners)
        {
            error_code ec;
            l->acceptor.close(ec);
            if (ec)
                BOOST_LOG_TRIVIAL(debug) << "tcp_transport: closing listener: " << ec.message();
        }
    }

    void tcp_transport::deliver()
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
        post_completion(std::move(handler), ec, std::move(request));
    }

    void tcp_transport::post_completion(next_handler handler, error_code ec, request_ptr request)
    {
        asio::post(_executor,
                   [handler = std::move(handler), ec, request = std::move(request)]() mutable
                   {
                       handler(ec, std::move(request));
                   });
    }

    //
    // tcp_stream_request
    //

    tcp_stream_request::tcp_stream_request(request_descriptor descriptor, asio::ip::tcp::socket socket)
    : stream_request(std::move(descriptor))
    , _socket(std::move(socket))
    {
    }

    void tcp_stream_request::handle_accept(accept_handler handler)
    {
        auto executor = _socket.get_executor();
        asio::post(executor,
                   [handler = std::move(handler), socket = std::move(_socket)]() mutable
                   {
                       if (not socket.is_open())
                           handler(asio::error::bad_descriptor, duplex_stream());
                       else
                           handler(error_code(), duplex_stream(is_owner, std::move(socket)));
                   });
    }

    void tcp_stream_request::handle_reject(error_code& ec)
    {
        _socket.shutdown(asio::socket_base::shutdown_both, ec);
        error_code close_ec;
        _socket.close(close_ec);
        if (not ec)
            ec = close_ec;
    }

}}
