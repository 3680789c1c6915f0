#include <gtest/gtest.h>
#include "test_utils.hpp"

#include <allium/onion/connection_dispatcher.hpp>
#include <allium/onion/errors.hpp>
#include <allium/onion/queue_transport.hpp>
#include <allium/onion/tls_terminator.hpp>

#include <deque>

using namespace allium::onion;

struct dispatcher_test : ::testing::Test
{
    asio::io_context ioc;
    std::shared_ptr<queue_transport> transport =
    std::make_shared<queue_transport>(ioc.get_executor(),
                                      service_identity { "allium-ampeloprasum", "test.onion" });

    std::shared_ptr<ssl::context> server_context = make_server_context(self_signed_identity().certificate_pem,
                                                                       self_signed_identity().private_key_pem);
    std::shared_ptr<ssl::context> client_context = permissive_client_context();

    std::vector<std::string> seen;
    std::shared_ptr<const http::request_handler> handler =
    http::make_request_handler([this](const http::request& req)
                               {
                                   seen.push_back(req.header.method() + " " + req.header.uri());
                                   return http::make_response(200, "Hello, World!");
                               });

    dispatcher_options options;
    std::shared_ptr<connection_dispatcher> dispatcher;

    bool finished = false;
    error_code run_error;

    std::deque<memory_stream> peers;

    void make_dispatcher(port_gate gate = port_gate())
    {
        options.connection.shutdown_timeout = 50ms;
        dispatcher = std::make_shared<connection_dispatcher>(ioc.get_executor(),
                                                             transport,
                                                             std::move(gate),
                                                             std::make_shared<tls_terminator>(server_context),
                                                             handler,
                                                             options);
    }

    void run()
    {
        dispatcher->async_run([this](const error_code& ec)
        {
            run_error = ec;
            finished = true;
        });
    }

    void start()
    {
        make_dispatcher();
        run();
    }

    const dispatch_stats& stats() const { return dispatcher->stats(); }

    /// push a request for port and return the peer's end of its stream
    memory_stream& push(std::uint16_t port,
                        std::shared_ptr<request_tally> tally,
                        error_code accept_error = error_code(),
                        error_code reject_error = error_code())
    {
        auto ends = make_memory_stream_pair(ioc.get_executor());
        peers.push_back(std::move(ends.first));
        transport->push(std::make_unique<tallied_stream_request>(begin_stream(port, "test.onion"),
                                                               std::move(tally),
                                                               std::move(ends.second),
                                                               accept_error,
                                                               reject_error));
        return peers.back();
    }

    struct tls_client
    {
        tls_client(memory_stream& peer, ssl::context& context)
        : stream(peer, context)
        {}

        ssl::stream<memory_stream&> stream;
        bool ready = false;
        error_code ec;
    };

    std::shared_ptr<tls_client> handshake(memory_stream& peer)
    {
        auto client = std::make_shared<tls_client>(peer, *client_context);
        client->stream.async_handshake(ssl::stream_base::client, [client](const error_code& ec)
        {
            client->ec = ec;
            client->ready = true;
        });
        return client;
    }

    testing::AssertionResult close_and_finish()
    {
        transport->close();
        return run_until(ioc, [&] { return finished; }, a_while());
    }
};

TEST_F(dispatcher_test, scenario_a_unlisted_port_is_rejected)
{
    start();
    auto tally = std::make_shared<request_tally>();
    auto& peer = push(8080, tally);

    ASSERT_TRUE(run_until(ioc, [&] { return stats().rejected == 1; }, a_while()));
    EXPECT_EQ(1, tally->rejects);
    EXPECT_EQ(0, tally->accepts);

    // the peer's circuit is gone
    auto result = converse(peer, "GET / HTTP/1.1\r\n\r\n");
    ASSERT_TRUE(run_until(ioc, [&] { return result->done; }, a_while()));
    EXPECT_TRUE(result->received.empty());

    ASSERT_TRUE(close_and_finish());
    EXPECT_FALSE(run_error);
    EXPECT_EQ(1u, stats().received.load());
    EXPECT_EQ(0u, stats().accepted.load());
    EXPECT_EQ(0u, stats().handshake_failed.load());
    EXPECT_TRUE(seen.empty());
}

TEST_F(dispatcher_test, scenario_b_tls_request_is_served)
{
    start();
    auto tally = std::make_shared<request_tally>();
    auto& peer = push(443, tally);

    auto client = handshake(peer);
    ASSERT_TRUE(run_until(ioc, [&] { return client->ready; }, a_while()));
    ASSERT_FALSE(client->ec) << client->ec.message();

    auto result = converse(client->stream, "GET / HTTP/1.1\r\nHost: test.onion\r\nConnection: close\r\n\r\n");
    ASSERT_TRUE(run_until(ioc, [&] { return result->done and stats().served == 1; }, a_while()));

    EXPECT_EQ(0u, result->received.find("HTTP/1.1 200 OK\r\n"));
    EXPECT_NE(std::string::npos, result->received.find("\r\n\r\nHello, World!"));
    EXPECT_EQ(error_code(asio::error::eof), result->read_error) << result->read_error.message();
    EXPECT_EQ((std::vector<std::string> { "GET /" }), seen);
    EXPECT_EQ(1, tally->accepts);
    EXPECT_EQ(0, tally->rejects);

    ASSERT_TRUE(close_and_finish());
    EXPECT_FALSE(run_error);
    EXPECT_EQ(0u, stats().active.load());
}

TEST_F(dispatcher_test, scenario_c_accept_failure_is_contained)
{
    start();
    auto failing = std::make_shared<request_tally>();
    push(80, failing, asio::error::connection_reset);
    auto next = std::make_shared<request_tally>();
    push(8080, next);

    ASSERT_TRUE(run_until(ioc, [&] { return stats().accept_failed == 1 and stats().rejected == 1; }, a_while()));
    EXPECT_EQ(1, failing->accepts);
    EXPECT_EQ(0, failing->rejects);
    EXPECT_EQ(1, next->rejects);

    ASSERT_TRUE(close_and_finish());
    EXPECT_FALSE(run_error);
    EXPECT_EQ(0u, stats().active.load());
    EXPECT_EQ(0u, stats().accepted.load());
}

TEST_F(dispatcher_test, scenario_d_handshake_failure_is_contained)
{
    start();
    auto bad = std::make_shared<request_tally>();
    auto& bad_peer = push(443, bad);
    auto garbage = converse(bad_peer, "GET / HTTP/1.1\r\nHost: test.onion\r\n\r\n");

    ASSERT_TRUE(run_until(ioc, [&] { return stats().handshake_failed == 1; }, a_while()));
    EXPECT_EQ(1, bad->accepts);

    // the loop is still taking connections
    auto good = std::make_shared<request_tally>();
    auto& good_peer = push(443, good);
    auto client = handshake(good_peer);
    ASSERT_TRUE(run_until(ioc, [&] { return client->ready; }, a_while()));
    ASSERT_FALSE(client->ec) << client->ec.message();

    auto result = converse(client->stream, "GET / HTTP/1.1\r\nHost: test.onion\r\nConnection: close\r\n\r\n");
    ASSERT_TRUE(run_until(ioc, [&] { return result->done; }, a_while()));
    EXPECT_EQ(0u, result->received.find("HTTP/1.1 200 OK\r\n"));
    EXPECT_FALSE(finished);

    ASSERT_TRUE(close_and_finish());
    EXPECT_FALSE(run_error);
}

TEST_F(dispatcher_test, failing_connection_does_not_disturb_a_serving_one)
{
    start();
    auto good = std::make_shared<request_tally>();
    auto& good_peer = push(443, good);
    auto client = handshake(good_peer);
    ASSERT_TRUE(run_until(ioc, [&] { return client->ready; }, a_while()));
    ASSERT_FALSE(client->ec);

    auto bad = std::make_shared<request_tally>();
    auto& bad_peer = push(443, bad);
    auto garbage = converse(bad_peer, "not a client hello\r\n");
    ASSERT_TRUE(run_until(ioc, [&] { return stats().handshake_failed == 1; }, a_while()));

    auto result = converse(client->stream,
                           "GET /one HTTP/1.1\r\nHost: test.onion\r\n\r\n"
                           "GET /two HTTP/1.1\r\nHost: test.onion\r\nConnection: close\r\n\r\n");
    ASSERT_TRUE(run_until(ioc, [&] { return result->done; }, a_while()));
    EXPECT_EQ(2u, count_of(result->received, "HTTP/1.1 200 OK\r\n"));
    EXPECT_EQ((std::vector<std::string> { "GET /one", "GET /two" }), seen);

    ASSERT_TRUE(close_and_finish());
}

TEST_F(dispatcher_test, every_request_is_accepted_or_rejected_exactly_once)
{
    start();
    const std::vector<std::uint16_t> ports { 22, 80, 443, 8080, 443, 1, 80, 65535 };
    std::vector<std::shared_ptr<request_tally>> tallies;
    for (auto port : ports)
    {
        tallies.push_back(std::make_shared<request_tally>());
        push(port, tallies.back()).close();
    }

    ASSERT_TRUE(close_and_finish());
    ASSERT_TRUE(run_until(ioc, [&] { return stats().handshake_failed == 4; }, a_while()));

    for (std::size_t i = 0 ; i < ports.size() ; ++i)
    {
        auto admitted = ports[i] == 80 or ports[i] == 443;
        EXPECT_EQ(admitted ? 1 : 0, tallies[i]->accepts) << "port " << ports[i];
        EXPECT_EQ(admitted ? 0 : 1, tallies[i]->rejects) << "port " << ports[i];
    }
    EXPECT_EQ(8u, stats().received.load());
    EXPECT_EQ(4u, stats().rejected.load());
    EXPECT_EQ(4u, stats().accepted.load());
    EXPECT_EQ(4u, stats().handshake_failed.load());
}

TEST_F(dispatcher_test, rejects_happen_in_arrival_order)
{
    auto tally = std::make_shared<request_tally>();
    const std::vector<std::uint16_t> ports { 9001, 21, 8443, 25, 3000, 81 };
    for (auto port : ports)
        push(port, tally);

    start();
    ASSERT_TRUE(close_and_finish());
    EXPECT_EQ(ports, tally->rejected_ports);
    EXPECT_EQ(0, tally->accepts);
}

TEST_F(dispatcher_test, reject_failure_is_not_fatal)
{
    start();
    auto tally = std::make_shared<request_tally>();
    push(8080, tally, error_code(), asio::error::not_connected);
    push(8081, tally);

    ASSERT_TRUE(run_until(ioc, [&] { return stats().rejected == 2; }, a_while()));
    EXPECT_EQ(1u, stats().reject_failed.load());
    EXPECT_FALSE(finished);

    ASSERT_TRUE(close_and_finish());
    EXPECT_FALSE(run_error);
}

TEST_F(dispatcher_test, end_of_sequence_leaves_running_connections_alone)
{
    start();
    auto tally = std::make_shared<request_tally>();
    auto& peer = push(443, tally);
    auto client = handshake(peer);
    ASSERT_TRUE(run_until(ioc, [&] { return client->ready; }, a_while()));
    ASSERT_FALSE(client->ec);

    ASSERT_TRUE(close_and_finish());
    EXPECT_FALSE(run_error);
    auto received = stats().received.load();

    // nothing more is taken from the transport
    auto late = std::make_shared<request_tally>();
    push(443, late);
    EXPECT_TRUE(run_dry(ioc, a_while()));
    EXPECT_EQ(received, stats().received.load());
    EXPECT_EQ(0, late->accepts);
    EXPECT_EQ(1, late->rejects);

    // but the established connection is still served
    auto result = converse(client->stream, "GET / HTTP/1.1\r\nHost: test.onion\r\nConnection: close\r\n\r\n");
    ASSERT_TRUE(run_until(ioc, [&] { return result->done; }, a_while()));
    EXPECT_EQ(0u, result->received.find("HTTP/1.1 200 OK\r\n"));
}

TEST_F(dispatcher_test, cancel_stops_the_loop)
{
    start();
    EXPECT_TRUE(run_dry(ioc, a_while()));
    dispatcher->cancel();

    ASSERT_TRUE(run_until(ioc, [&] { return finished; }, a_while()));
    EXPECT_EQ(asio::error::operation_aborted, run_error);

    auto tally = std::make_shared<request_tally>();
    push(443, tally);
    EXPECT_EQ(1u, transport->pending());
    EXPECT_EQ(0u, stats().received.load());
}

TEST_F(dispatcher_test, cancel_before_run)
{
    make_dispatcher();
    dispatcher->cancel();
    run();

    ASSERT_TRUE(run_until(ioc, [&] { return finished; }, a_while()));
    EXPECT_EQ(asio::error::operation_aborted, run_error);
}

TEST_F(dispatcher_test, transport_failure_ends_the_loop)
{
    start();
    auto tally = std::make_shared<request_tally>();
    push(8080, tally);
    transport->fail(asio::error::access_denied);

    ASSERT_TRUE(run_until(ioc, [&] { return finished; }, a_while()));
    EXPECT_EQ(error_code(dispatch_error::transport_failed), run_error);
    EXPECT_EQ(1, tally->rejects);
}

TEST_F(dispatcher_test, runs_only_once)
{
    start();
    bool second_done = false;
    error_code second_error;
    dispatcher->async_run([&](const error_code& ec)
    {
        second_error = ec;
        second_done = true;
    });

    ASSERT_TRUE(run_until(ioc, [&] { return second_done; }, a_while()));
    EXPECT_EQ(asio::error::already_started, second_error);
    EXPECT_FALSE(finished);

    ASSERT_TRUE(close_and_finish());
}

TEST_F(dispatcher_test, connection_limit)
{
    options.max_connections = 1;
    start();

    auto first = std::make_shared<request_tally>();
    auto& first_peer = push(443, first);
    ASSERT_TRUE(run_until(ioc, [&] { return stats().accepted == 1; }, a_while()));

    auto second = std::make_shared<request_tally>();
    push(443, second);
    ASSERT_TRUE(run_until(ioc, [&] { return stats().rejected == 1; }, a_while()));
    EXPECT_EQ(0, second->accepts);
    EXPECT_EQ(1, second->rejects);

    // the first peer gives up, freeing the slot
    first_peer.close();
    ASSERT_TRUE(run_until(ioc, [&] { return stats().active == 0; }, a_while()));
    EXPECT_EQ(1u, stats().handshake_failed.load());

    auto third = std::make_shared<request_tally>();
    push(443, third).close();
    ASSERT_TRUE(run_until(ioc, [&] { return stats().accepted == 2; }, a_while()));
    EXPECT_EQ(1, third->accepts);

    ASSERT_TRUE(close_and_finish());
}

TEST_F(dispatcher_test, handshake_deadline)
{
    options.handshake_timeout = 50ms;
    start();

    auto tally = std::make_shared<request_tally>();
    push(443, tally);

    ASSERT_TRUE(run_until(ioc, [&] { return stats().handshake_failed == 1; }, a_while()));
    EXPECT_EQ(0u, stats().active.load());
    ASSERT_TRUE(close_and_finish());
}
