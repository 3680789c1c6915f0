#include <allium/onion/http/server_connection.hpp>
#include <allium/onion/http/errors.hpp>
#include <allium/onion/http/request_header.hpp>
#include <allium/onion/errors.hpp>
#include <allium/onion/api/exception.hpp>

namespace allium { namespace onion { namespace http {

    server_connection::server_connection(duplex_stream stream,
                                         std::shared_ptr<const request_handler> handler,
                                         connection_options options)
    : _stream(std::move(stream))
    , _handler(std::move(handler))
    , _options(options)
    {
        ALLIUM_ONION_TRACE_METHOD("server_connection", __func__);
        http_parser_init(parser(), HTTP_REQUEST);
        parser()->data = this;
        init_callbacks();
    }

    namespace {
        server_connection* to_this(http_parser* p) {
            return reinterpret_cast<server_connection*>(p->data);
        }

        bool has_body(int code) {
            return code >= 200 and code != 204 and code != 304;
        }
    }

    void server_connection::init_callbacks()
    {
        auto settings = parser_settings();
        http_parser_settings_init(settings);

        settings->on_message_begin = [](http_parser* p) {
            return to_this(p)->handle_message_begin();
        };
        settings->on_url = [](http_parser* p, const char* data,
                              std::size_t length) {
            return to_this(p)->handle_message_url(data, length);
        };
        settings->on_header_field = [](http_parser* p, const char* begin,
                                       std::size_t length) {
            return to_this(p)->handle_message_header_field(begin, length);
        };
        settings->on_header_value = [](http_parser* p, const char* begin,
                                       std::size_t length) {
            return to_this(p)->handle_message_header_value(begin, length);
        };
        settings->on_headers_complete = [](http_parser* p) {
            return to_this(p)->handle_message_headers_complete();
        };
        settings->on_body = [](http_parser* p, const char* data,
                               std::size_t length) {
            return to_this(p)->handle_message_body(data, length);
        };
        settings->on_message_complete = [](http_parser* p) {
            return to_this(p)->handle_message_complete();
        };
    }

    void server_connection::async_serve(completion_handler handler)
    {
        ALLIUM_ONION_TRACE_METHOD("server_connection", __func__);
        _completion = std::move(handler);
        asio::post(_strand, [self = shared_from_this()] {
            self->collect_more_data();
        });
    }

    void server_connection::collect_more_data()
    {
        ALLIUM_ONION_TRACE_METHOD("server_connection", __func__);
        assert(_strand.running_in_this_thread());
        if (_finished or _reading) return;

        _reading = true;
        arm_idle_timer();
        _stream.async_read_some(asio::buffer(_read_buffer),
                                asio::bind_executor(_strand,
                                                    [self = shared_from_this()]
                                                    (const error_code& ec, std::size_t bytes)
                                                    {
                                                        self->handle_read(ec, bytes);
                                                    }));
    }

    void server_connection::handle_read(const error_code &ec,
                                        std::size_t bytes_available)
    {
        ALLIUM_ONION_TRACE_METHOD_N("server_connection", __func__,
                                    ec.message(), bytes_available);
        assert(_strand.running_in_this_thread());
        _reading = false;
        ++_io_generation;

        if (_finished) return;
        if (_timed_out) {
            finish(dispatch_error::idle_timeout);
            return;
        }

        _unparsed.append(_read_buffer.data(), bytes_available);
        if (ec)
        {
            if (not is_eof(ec)) {
                finish(ec);
                return;
            }
            _peer_closed = true;
        }
        process_input();
    }

    void server_connection::process_input()
    {
        ALLIUM_ONION_TRACE_METHOD_N("server_connection", __func__, _unparsed.size());
        assert(_strand.running_in_this_thread());

        while (_completed.empty() and not _unparsed.empty())
        {
            auto parsed = http_parser_execute(parser(),
                                              parser_settings(),
                                              _unparsed.data(),
                                              _unparsed.size());
            _unparsed.erase(0, parsed);

            auto err = parser_error(parser());
            if (err == HPE_PAUSED)
            {
                http_parser_pause(parser(), 0);
            }
            else if (_body_too_large)
            {
                refuse(413, protocol_error_code::body_too_large);
                return;
            }
            else if (err != HPE_OK)
            {
                BOOST_LOG_TRIVIAL(debug) << "server_connection: " << describe(err);
                refuse(400, protocol_error_code::malformed_request);
                return;
            }
            else if (parsed == 0)
            {
                break;
            }

            // whatever follows an upgrade request belongs to the next protocol
            if (not _completed.empty() and _completed.front().upgrade)
                break;
        }

        if (not _completed.empty())
        {
            auto next = std::move(_completed.front());
            _completed.pop_front();
            respond(std::move(next));
        }
        else if (_peer_closed)
        {
            handle_end_of_input();
        }
        else
        {
            collect_more_data();
        }
    }

    void server_connection::handle_end_of_input()
    {
        ALLIUM_ONION_TRACE_METHOD("server_connection", __func__);
        if (_in_message) {
            finish(protocol_error_code::incomplete_request);
        }
        else {
            close_gracefully(error_code());
        }
    }

    int server_connection::handle_message_begin()
    {
        _current = request();
        _current_header = nullptr;
        _in_header_value = false;
        _in_message = true;
        return 0;
    }

    int server_connection::handle_message_url(const char* begin, std::size_t size)
    {
        _current.header.mutable_uri()->append(begin, size);
        return 0;
    }

    int server_connection::handle_message_header_field(const char* begin,
                                                       std::size_t size)
    {
        if (_in_header_value or not _current_header)
        {
            _current_header = _current.header.add_headers();
            _in_header_value = false;
        }
        _current_header->mutable_name()->append(begin, size);
        return 0;
    }

    int server_connection::handle_message_header_value(const char* begin,
                                                       std::size_t size)
    {
        if (not _current_header)
            return 1;
        _in_header_value = true;
        _current_header->mutable_value()->append(begin, size);
        return 0;
    }

    namespace
    {
        void check_url_field(const http_parser_url& url_parser,
                             HttpRequestHeader& msg,
                             std::string* (HttpRequestHeader::QueryParts::*locate)(),
                             int field)
        {
            if (url_parser.field_set & (1 << field))
            {
                auto& slot = url_parser.field_data[field];
                std::size_t offset = slot.off;
                std::size_t length = slot.len;
                auto source = msg.uri().data();
                auto& parts = *(msg.mutable_query());
                (parts.*locate)()->append(source + offset, length);
            }
        }
    }

    int server_connection::handle_message_headers_complete()
    {
        _current_header = nullptr;
        auto& header = _current.header;

        http_parser_url url_parser;
        http_parser_url_init(std::addressof(url_parser));
        auto result = http_parser_parse_url(header.uri().data(),
                                            header.uri().size(),
                                            parser()->method == HTTP_CONNECT,
                                            std::addressof(url_parser));
        if (result) {
            // anything other than 0, 1 or 2 stops the parser with an error
            return 3;
        }

        check_url_field(url_parser, header, &HttpRequestHeader::QueryParts::mutable_schema, UF_SCHEMA);
        check_url_field(url_parser, header, &HttpRequestHeader::QueryParts::mutable_host, UF_HOST);
        check_url_field(url_parser, header, &HttpRequestHeader::QueryParts::mutable_port, UF_PORT);
        check_url_field(url_parser, header, &HttpRequestHeader::QueryParts::mutable_path, UF_PATH);
        check_url_field(url_parser, header, &HttpRequestHeader::QueryParts::mutable_query, UF_QUERY);
        check_url_field(url_parser, header, &HttpRequestHeader::QueryParts::mutable_fragment, UF_FRAGMENT);
        check_url_field(url_parser, header, &HttpRequestHeader::QueryParts::mutable_user_info, UF_USERINFO);
        header.set_method(http_method_str(static_cast<http_method>(parser()->method)));
        header.set_version_major(parser()->http_major);
        header.set_version_minor(parser()->http_minor);
        return 0;
    }

    int server_connection::handle_message_body(const char* data,
                                               std::size_t size)
    {
        if (_current.body.size() + size > _options.max_body_bytes) {
            _body_too_large = true;
            return 1;
        }
        _current.body.append(data, size);
        return 0;
    }

    int server_connection::handle_message_complete()
    {
        _current.upgrade = parser()->upgrade != 0;
        _current.keep_alive = http_should_keep_alive(parser()) != 0;
        _in_message = false;
        _completed.push_back(std::move(_current));
        _current = request();

        // one request at a time. the rest stays buffered until the response is out
        http_parser_pause(parser(), 1);
        return 0;
    }

    void server_connection::respond(request req)
    {
        ALLIUM_ONION_TRACE_METHOD_N("server_connection", __func__, req.header.method(), req.header.uri());
        assert(_strand.running_in_this_thread());

        response res;
        bool keep_alive = req.keep_alive;
        try {
            res = _handler->handle(req);
        }
        catch(...)
        {
            auto report = api::describe_exception(std::current_exception(), "request handler");
            BOOST_LOG_TRIVIAL(error) << "server_connection: " << api::summary(report);
            res = make_exception_response(report);
            keep_alive = false;
        }

        res.header.set_version_major(req.header.version_major());
        res.header.set_version_minor(req.header.version_minor());

        if (req.upgrade)
        {
            if (status_code(res) == 101 and res.upgrade)
            {
                _pending_upgrade = std::move(res.upgrade);
            }
            else
            {
                // the bytes that follow are not HTTP. nothing more can be read
                keep_alive = false;
            }
        }
        else if (status_code(res) == 101)
        {
            BOOST_LOG_TRIVIAL(warning) << "server_connection: 101 response to a request that did not ask for an upgrade";
            res = make_response(500);
            keep_alive = false;
        }

        if (req.header.method() == "HEAD")
        {
            if (not res.body.empty())
                set_header(res.header, "Content-Length", std::to_string(res.body.size()));
            res.body.clear();
        }
        write_response(std::move(res), keep_alive);
    }

    void server_connection::refuse(int code, error_code reason)
    {
        ALLIUM_ONION_TRACE_METHOD_N("server_connection", __func__, code, reason.message());
        _unparsed.clear();
        _completed.clear();
        _refusal = reason;
        write_response(make_response(code, reason.message()), false);
    }

    void server_connection::write_response(response res, bool keep_alive)
    {
        auto code = status_code(res);
        if (has_body(code)) {
            if (res.body.size() or find_headers_like(res.header.headers(), "Content-Length").empty())
                set_header(res.header, "Content-Length", std::to_string(res.body.size()));
        }
        if (has_header_token(res.header.headers(), "Connection", "close")) {
            keep_alive = false;
        }
        if (not keep_alive and code != 101) {
            set_header(res.header, "Connection", "close");
        }
        _close_after_response = not keep_alive;

        _response_data = to_response_buffer(res.header);
        _response_data.append(res.body);

        _writing = true;
        arm_idle_timer();
        asio::async_write(_stream, asio::buffer(_response_data),
                          asio::bind_executor(_strand,
                                              [self = shared_from_this()]
                                              (const error_code& ec, std::size_t)
                                              {
                                                  self->handle_written(ec);
                                              }));
    }

    void server_connection::handle_written(const error_code& ec)
    {
        ALLIUM_ONION_TRACE_METHOD_N("server_connection", __func__, ec.message());
        assert(_strand.running_in_this_thread());
        _writing = false;
        ++_io_generation;

        if (_finished) return;
        if (_timed_out) {
            finish(dispatch_error::idle_timeout);
            return;
        }
        if (ec) {
            finish(ec);
            return;
        }

        ++_requests_served;
        _response_data.clear();

        if (_pending_upgrade)
        {
            auto upgrade = std::move(_pending_upgrade);
            auto buffered = std::move(_unparsed);
            auto stream = std::move(_stream);
            finish(error_code());
            try {
                upgrade(std::move(stream), std::move(buffered));
            }
            catch(...) {
                BOOST_LOG_TRIVIAL(error) << "server_connection: "
                << api::summary(api::describe_exception(std::current_exception(), "upgrade"));
            }
            return;
        }

        if (_close_after_response)
        {
            close_gracefully(_refusal);
            return;
        }

        process_input();
    }

    void server_connection::arm_idle_timer()
    {
        if (_options.idle_timeout.count() == 0)
            return;

        _idle_timer.expires_after(_options.idle_timeout);
        _idle_timer.async_wait(asio::bind_executor(_strand,
                                                   [self = shared_from_this(), generation = _io_generation]
                                                   (const error_code& ec)
                                                   {
                                                       if (ec != asio::error::operation_aborted)
                                                           self->handle_idle_timeout(generation);
                                                   }));
    }

    void server_connection::handle_idle_timeout(std::size_t generation)
    {
        ALLIUM_ONION_TRACE_METHOD("server_connection", __func__);
        if (_finished or generation != _io_generation)
            return;
        if (_reading or _writing)
        {
            _timed_out = true;
            error_code ignored;
            _stream.close(ignored);
        }
    }

    void server_connection::close_gracefully(error_code reason)
    {
        ALLIUM_ONION_TRACE_METHOD_N("server_connection", __func__, reason.message());
        if (_finished or _closing)
            return;
        _closing = true;
        ++_io_generation;

        if (_options.shutdown_timeout.count())
        {
            _idle_timer.expires_after(_options.shutdown_timeout);
            _idle_timer.async_wait(asio::bind_executor(_strand,
                                                       [self = shared_from_this(), generation = _io_generation]
                                                       (const error_code& ec)
                                                       {
                                                           if (ec != asio::error::operation_aborted)
                                                               self->handle_shutdown_timeout(generation);
                                                       }));
        }

        _stream.async_shutdown(asio::bind_executor(_strand,
                                                   [self = shared_from_this(), reason]
                                                   (const error_code& ec)
                                                   {
                                                       self->handle_shutdown(ec, reason);
                                                   }));
    }

    void server_connection::handle_shutdown(const error_code& ec, error_code reason)
    {
        ALLIUM_ONION_TRACE_METHOD_N("server_connection", __func__, ec.message());
        assert(_strand.running_in_this_thread());
        if (ec and not is_eof(ec) and ec != asio::error::operation_aborted)
            BOOST_LOG_TRIVIAL(debug) << "server_connection: shutdown: " << ec.message();
        finish(reason);
    }

    void server_connection::handle_shutdown_timeout(std::size_t generation)
    {
        ALLIUM_ONION_TRACE_METHOD("server_connection", __func__);
        if (_finished or generation != _io_generation)
            return;
        BOOST_LOG_TRIVIAL(debug) << "server_connection: peer did not answer close_notify";
        error_code ignored;
        _stream.close(ignored);
    }

    void server_connection::finish(error_code ec)
    {
        ALLIUM_ONION_TRACE_METHOD_N("server_connection", __func__, ec.message());
        if (_finished)
            return;
        _finished = true;
        _idle_timer.cancel();

        if (_stream.valid())
        {
            error_code ignored;
            _stream.close(ignored);
        }

        auto completion = std::move(_completion);
        if (completion)
            completion(ec);
    }

}}}
