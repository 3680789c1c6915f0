#pragma once

#include <allium/onion/config.hpp>
#include <allium/onion/duplex_stream.hpp>
#include <allium/onion/http/message.hpp>
#include <allium/onion/http/parse.hpp>
#include <allium/onion/http/request_handler.hpp>

#include <array>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace allium { namespace onion { namespace http {

    struct connection_options
    {
        /// close the connection if a read or write makes no progress for this
        /// long. zero means wait forever.
        std::chrono::milliseconds idle_timeout { 0 };

        /// how long to wait for the peer to answer our TLS close_notify before
        /// closing anyway. zero means wait forever.
        std::chrono::milliseconds shutdown_timeout { 1000 };

        /// larger request bodies are refused with 413
        std::size_t max_body_bytes = 1024 * 1024;
    };

    /// Serves HTTP/1.x over one duplex stream until the peer closes it, an
    /// error occurs or the connection is upgraded.
    ///
    /// Requests are answered strictly in the order they arrive. Pipelined
    /// requests are held in the input buffer until the response to the previous
    /// request has been written.
    ///
    struct server_connection : std::enable_shared_from_this<server_connection>
    {
        using completion_handler = std::function<void(const error_code& ec)>;

        /// @post the server_connection owns the stream
        server_connection(duplex_stream stream,
                          std::shared_ptr<const request_handler> handler,
                          connection_options options = connection_options());

        server_connection(const server_connection&) = delete;
        server_connection& operator=(const server_connection&) = delete;

        /// Start serving. The handler is called once, never from within this
        /// call, with:
        /// - no error when the peer closed the connection between requests, or
        ///   after the connection was handed to an upgrade function
        /// - an http::protocol_error_code when the peer sent something that is
        ///   not HTTP (it has been answered with a 4xx status)
        /// - dispatch_error::idle_timeout when the deadline expired
        /// - the transport's error otherwise
        void async_serve(completion_handler handler);

        std::size_t requests_served() const { return _requests_served; }

    private:
        /// second part of constuctor - required because of c api
        void init_callbacks();

        // parser handlers
        int handle_message_begin();
        int handle_message_url(const char* begin, std::size_t size);
        int handle_message_header_field(const char* begin, std::size_t size);
        int handle_message_header_value(const char* begin, std::size_t size);
        int handle_message_headers_complete();
        int handle_message_body(const char* begin, std::size_t size);
        int handle_message_complete();

        void collect_more_data();
        void handle_read(const error_code& ec, std::size_t bytes_available);

        /// parse buffered input until a request is complete, then answer it
        void process_input();
        void handle_end_of_input();

        void respond(request req);
        void refuse(int code, error_code reason);
        void write_response(response res, bool keep_alive);
        void handle_written(const error_code& ec);

        void arm_idle_timer();
        void handle_idle_timeout(std::size_t generation);

        /// end the session (close_notify over TLS), then finish with reason
        void close_gracefully(error_code reason);
        void handle_shutdown(const error_code& ec, error_code reason);
        void handle_shutdown_timeout(std::size_t generation);

        void finish(error_code ec);

        http_parser_settings* parser_settings() { return std::addressof(_parser_settings); }
        http_parser* parser() { return std::addressof(_parser); }

        duplex_stream _stream;
        std::shared_ptr<const request_handler> _handler;
        connection_options _options;

        asio::strand<executor_type> _strand { _stream.get_executor() };
        asio::steady_timer _idle_timer { _strand };
        std::size_t _io_generation = 0;

        http_parser _parser;
        http_parser_settings _parser_settings;
        std::array<char, 4096> _read_buffer;
        std::string _unparsed;

        // request under construction
        request _current;
        Header* _current_header = nullptr;
        bool _in_header_value = false;
        bool _in_message = false;
        bool _body_too_large = false;

        std::deque<request> _completed;
        std::string _response_data;
        upgrade_function _pending_upgrade;

        bool _reading = false;
        bool _writing = false;
        bool _peer_closed = false;
        bool _close_after_response = false;
        bool _timed_out = false;
        bool _closing = false;
        bool _finished = false;
        error_code _refusal;

        std::size_t _requests_served = 0;
        completion_handler _completion;
    };

}}}
