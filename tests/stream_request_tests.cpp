#include <gtest/gtest.h>
#include "test_utils.hpp"
#include <allium/onion/errors.hpp>
#include <allium/onion/queue_transport.hpp>

using namespace allium::onion;

struct stream_request_test : ::testing::Test
{
    asio::io_context ioc;
    std::shared_ptr<request_tally> tally = std::make_shared<request_tally>();

    std::unique_ptr<tallied_stream_request> make_request(std::uint16_t port,
                                                       error_code accept_error = error_code(),
                                                       error_code reject_error = error_code())
    {
        auto ends = make_memory_stream_pair(ioc.get_executor());
        peers.push_back(std::move(ends.first));
        return std::make_unique<tallied_stream_request>(begin_stream(port),
                                                      tally,
                                                      std::move(ends.second),
                                                      accept_error,
                                                      reject_error);
    }

    std::vector<memory_stream> peers;
};

TEST_F(stream_request_test, accept_delivers_the_stream_once)
{
    auto request = make_request(443);

    bool accepted = false;
    error_code accept_error;
    duplex_stream stream;
    request->async_accept([&](const error_code& ec, duplex_stream s) {
        accept_error = ec;
        stream = std::move(s);
        accepted = true;
    });
    EXPECT_FALSE(accepted);
    ASSERT_TRUE(run_until(ioc, [&] { return accepted; }, a_while()));
    EXPECT_FALSE(accept_error);
    EXPECT_TRUE(stream.valid());
    EXPECT_TRUE(request->consumed());

    EXPECT_TRUE(throws<system_error>([&] { request->async_accept([](const error_code&, duplex_stream) {}); }));

    error_code ec;
    request->reject(ec);
    EXPECT_EQ(error_code(dispatch_error::request_already_consumed), ec);

    EXPECT_EQ(1, tally->accepts);
    EXPECT_EQ(0, tally->rejects);
}

TEST_F(stream_request_test, reject_is_exactly_once)
{
    auto request = make_request(8080);

    EXPECT_TRUE(no_exception([&] { request->reject(); }));
    EXPECT_TRUE(throws<system_error>([&] { request->reject(); }));
    EXPECT_TRUE(throws<system_error>([&] { request->async_accept([](const error_code&, duplex_stream) {}); }));

    EXPECT_EQ(0, tally->accepts);
    EXPECT_EQ(1, tally->rejects);
}

TEST_F(stream_request_test, reject_failure_is_reported)
{
    auto request = make_request(8080, error_code(), asio::error::not_connected);

    error_code ec;
    request->reject(ec);
    EXPECT_EQ(asio::error::not_connected, ec);
    EXPECT_TRUE(request->consumed());
}

TEST_F(stream_request_test, memory_stream_request_reject_gives_peer_eof)
{
    auto ends = make_memory_stream_pair(ioc.get_executor());
    memory_stream_request request(begin_stream(22), std::move(ends.second));

    error_code ec;
    request.reject(ec);
    EXPECT_FALSE(ec);

    std::array<char, 16> buf;
    error_code read_error;
    bool done = false;
    ends.first.async_read_some(asio::buffer(buf), [&](const error_code& ec, std::size_t) {
        read_error = ec;
        done = true;
    });
    ASSERT_TRUE(run_until(ioc, [&] { return done; }, a_while()));
    EXPECT_EQ(asio::error::eof, read_error);
}

//
// queue_transport
//

struct queue_transport_test : stream_request_test
{
    queue_transport transport { ioc.get_executor(), service_identity { "nick", "name.onion" } };

    struct next_result
    {
        bool done = false;
        error_code ec;
        transport_source::request_ptr request;
    };

    std::shared_ptr<next_result> next()
    {
        auto result = std::make_shared<next_result>();
        transport.async_next([result](const error_code& ec, transport_source::request_ptr request) {
            result->ec = ec;
            result->request = std::move(request);
            result->done = true;
        });
        return result;
    }
};

TEST_F(queue_transport_test, delivers_in_order_then_ends)
{
    transport.push(make_request(1));
    transport.push(make_request(2));
    transport.close();

    for (std::uint16_t port : { 1, 2 })
    {
        auto r = next();
        EXPECT_FALSE(r->done);
        ASSERT_TRUE(run_until(ioc, [&] { return r->done; }, a_while()));
        EXPECT_FALSE(r->ec);
        ASSERT_TRUE(r->request);
        EXPECT_EQ(port, r->request->descriptor().port);
        r->request->reject();
    }

    for (int i = 0 ; i < 2 ; ++i)
    {
        auto r = next();
        ASSERT_TRUE(run_until(ioc, [&] { return r->done; }, a_while()));
        EXPECT_FALSE(r->ec);
        EXPECT_FALSE(r->request);
    }
}

TEST_F(queue_transport_test, waits_for_a_push)
{
    auto r = next();
    EXPECT_TRUE(run_dry(ioc, a_while()));
    EXPECT_FALSE(r->done);

    transport.push(make_request(80));
    ASSERT_TRUE(run_until(ioc, [&] { return r->done; }, a_while()));
    ASSERT_TRUE(r->request);
    r->request->reject();
}

TEST_F(queue_transport_test, cancel_aborts_the_pull)
{
    auto r = next();
    transport.cancel();
    ASSERT_TRUE(run_until(ioc, [&] { return r->done; }, a_while()));
    EXPECT_EQ(asio::error::operation_aborted, r->ec);
    EXPECT_FALSE(r->request);
}

TEST_F(queue_transport_test, failure_follows_queued_requests)
{
    transport.push(make_request(80));
    transport.fail(dispatch_error::transport_failed);

    auto r1 = next();
    ASSERT_TRUE(run_until(ioc, [&] { return r1->done; }, a_while()));
    ASSERT_TRUE(r1->request);
    r1->request->reject();

    auto r2 = next();
    ASSERT_TRUE(run_until(ioc, [&] { return r2->done; }, a_while()));
    EXPECT_EQ(error_code(dispatch_error::transport_failed), r2->ec);
}

TEST_F(queue_transport_test, push_after_close_is_rejected)
{
    transport.close();
    transport.push(make_request(80));
    EXPECT_EQ(1, tally->rejects);
    EXPECT_EQ(0u, transport.pending());
}
