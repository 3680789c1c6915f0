#include <gtest/gtest.h>
#include "test_utils.hpp"

#include <allium/onion/errors.hpp>
#include <allium/onion/http/server_connection.hpp>
#include <allium/onion/tls_terminator.hpp>

using namespace allium::onion;

struct tls_test : ::testing::Test
{
    asio::io_context ioc;
    std::pair<memory_stream, memory_stream> ends = make_memory_stream_pair(ioc.get_executor());

    std::shared_ptr<ssl::context> server_context = make_server_context(self_signed_identity().certificate_pem,
                                                                       self_signed_identity().private_key_pem);
    std::shared_ptr<ssl::context> client_context = permissive_client_context();
    ssl::stream<memory_stream&> client { ends.first, *client_context };

    tls_terminator terminator { server_context };

    bool terminated = false;
    error_code terminate_error;
    duplex_stream encrypted;

    void terminate(std::chrono::milliseconds handshake_timeout = 5000ms)
    {
        terminator.async_terminate(duplex_stream(is_owner, std::move(ends.second)),
                                   handshake_timeout,
                                   [this](const error_code& ec, duplex_stream stream)
                                   {
                                       terminate_error = ec;
                                       encrypted = std::move(stream);
                                       terminated = true;
                                   });
    }

    void handshake()
    {
        terminate();

        bool client_ready = false;
        error_code client_error;
        client.async_handshake(ssl::stream_base::client, [&](const error_code& ec) {
            client_error = ec;
            client_ready = true;
        });

        ASSERT_TRUE(run_until(ioc, [&] { return terminated and client_ready; }, a_while()));
        ASSERT_FALSE(terminate_error) << terminate_error.message();
        ASSERT_FALSE(client_error) << client_error.message();
    }

    bool served = false;
    error_code serve_error;

    std::shared_ptr<http::server_connection> serve(http::connection_options options)
    {
        auto handler = http::make_request_handler([](const http::request& req) {
            return http::make_response(200, "secure " + req.header.uri());
        });
        auto connection = std::make_shared<http::server_connection>(std::move(encrypted), handler, options);
        connection->async_serve([this](const error_code& ec) {
            serve_error = ec;
            served = true;
        });
        return connection;
    }
};

TEST_F(tls_test, handshake_then_http)
{
    handshake();
    ASSERT_TRUE(encrypted.valid());

    http::connection_options options;
    options.shutdown_timeout = 0ms;
    auto connection = serve(options);

    auto result = converse(client, "GET /hello HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n");
    ASSERT_TRUE(run_until(ioc, [&] { return result->done; }, a_while()));
    EXPECT_EQ(0u, result->received.find("HTTP/1.1 200 OK\r\n"));
    EXPECT_NE(std::string::npos, result->received.find("\r\n\r\nsecure /hello"));

    // the server said close_notify and is waiting for ours
    EXPECT_EQ(error_code(asio::error::eof), result->read_error) << result->read_error.message();
    EXPECT_FALSE(served);

    error_code client_shutdown_error = asio::error::would_block;
    client.async_shutdown([&](const error_code& ec) { client_shutdown_error = ec; });

    ASSERT_TRUE(run_until(ioc, [&] { return served and client_shutdown_error != asio::error::would_block; },
                          a_while()));
    EXPECT_FALSE(serve_error) << serve_error.message();
    EXPECT_FALSE(client_shutdown_error) << client_shutdown_error.message();
}

TEST_F(tls_test, peer_that_never_answers_close_notify_is_closed_after_a_while)
{
    handshake();
    ASSERT_TRUE(encrypted.valid());

    http::connection_options options;
    options.shutdown_timeout = 50ms;
    auto connection = serve(options);

    auto result = converse(client, "GET /hello HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n");
    ASSERT_TRUE(run_until(ioc, [&] { return served and result->done; }, a_while()));
    EXPECT_FALSE(serve_error) << serve_error.message();
    EXPECT_EQ(1u, connection->requests_served());
    EXPECT_EQ(error_code(asio::error::eof), result->read_error) << result->read_error.message();
}

TEST_F(tls_test, plaintext_peer_fails_the_handshake)
{
    terminate();
    auto result = converse(ends.first, "GET / HTTP/1.1\r\nHost: localhost\r\n\r\n");

    ASSERT_TRUE(run_until(ioc, [&] { return terminated; }, a_while()));
    EXPECT_TRUE(terminate_error);
    EXPECT_NE(error_code(dispatch_error::handshake_timeout), terminate_error);
    EXPECT_FALSE(encrypted.valid());
}

TEST_F(tls_test, silent_peer_times_out)
{
    terminate(50ms);

    ASSERT_TRUE(run_until(ioc, [&] { return terminated; }, a_while()));
    EXPECT_EQ(error_code(dispatch_error::handshake_timeout), terminate_error);
    EXPECT_FALSE(encrypted.valid());
}

TEST(tls_context_tests, bad_credentials_are_refused)
{
    EXPECT_TRUE(throws<system_error>([] { make_server_context("not a certificate", "not a key"); }));
    EXPECT_TRUE(throws<system_error>([] {
        make_server_context(self_signed_identity().certificate_pem, "not a key");
    }));
    EXPECT_TRUE(throws<system_error>([] {
        load_server_context("/nonexistent/cert.pem", "/nonexistent/key.pem");
    }));
    EXPECT_TRUE(no_exception([] {
        make_server_context(self_signed_identity().certificate_pem, self_signed_identity().private_key_pem);
    }));
}

TEST(plain_terminator_tests, passes_the_stream_through)
{
    asio::io_context ioc;
    auto ends = make_memory_stream_pair(ioc.get_executor());

    plain_terminator terminator;
    bool done = false;
    error_code result;
    duplex_stream stream;
    terminator.async_terminate(duplex_stream(is_owner, std::move(ends.second)), 0ms,
                               [&](const error_code& ec, duplex_stream s)
                               {
                                   result = ec;
                                   stream = std::move(s);
                                   done = true;
                               });
    EXPECT_FALSE(done);
    ASSERT_TRUE(run_until(ioc, [&] { return done; }, a_while()));
    EXPECT_FALSE(result);
    EXPECT_TRUE(stream.valid());
    EXPECT_STREQ("plain", terminator.name());
}
