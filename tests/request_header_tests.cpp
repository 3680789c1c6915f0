#include <gtest/gtest.h>

#include <allium/onion/http/request_header.hpp>

#include <initializer_list>
#include <stdexcept>
#include <utility>

using namespace allium::onion;

namespace {

    HttpRequestHeader make_request(std::initializer_list<std::pair<const char*, const char*>> headers)
    {
        HttpRequestHeader req;
        req.set_method("GET");
        req.set_uri("/");
        req.set_version_major(1);
        req.set_version_minor(1);
        for (auto& h : headers)
        {
            auto header = req.add_headers();
            header->set_name(h.first);
            header->set_value(h.second);
        }
        return req;
    }

}

TEST(request_header_tests, names_match_without_regard_to_case)
{
    auto req = make_request({ { "Host", "test.onion" }, { "X-Thing", "1" }, { "x-thing", "2" } });

    auto host = http::find_only_header_like(req, "HOST");
    ASSERT_TRUE(host);
    EXPECT_EQ("test.onion", host->value());

    EXPECT_FALSE(http::find_only_header_like(req, "Content-Length"));
    EXPECT_THROW(http::find_only_header_like(req, "X-THING"), std::runtime_error);

    auto things = http::find_headers_like(req, "x-Thing");
    ASSERT_EQ(2u, things.size());
    EXPECT_EQ("1", things[0].get().value());
    EXPECT_EQ("2", things[1].get().value());
}

TEST(request_header_tests, connection_tokens)
{
    auto req = make_request({ { "Connection", "keep-alive, Upgrade" }, { "connection", " close " } });

    EXPECT_TRUE(http::has_header_token(req.headers(), "Connection", "upgrade"));
    EXPECT_TRUE(http::has_header_token(req.headers(), "Connection", "Close"));
    EXPECT_TRUE(http::has_header_token(req.headers(), "Connection", "keep-alive"));
    EXPECT_FALSE(http::has_header_token(req.headers(), "Connection", "keep"));
    EXPECT_FALSE(http::has_header_token(req.headers(), "Upgrade", "websocket"));
}

TEST(request_header_tests, set_header_leaves_one)
{
    HttpResponseHeader res;
    res.set_version_major(1);
    res.set_version_minor(1);
    http::set_status(res, 200, "");
    http::add_header(res, "Content-Type", "text/plain");
    http::add_header(res, "X-Dup", "a");
    http::add_header(res, "Server", "allium");
    http::add_header(res, "x-dup", "b");

    http::set_header(res, "X-DUP", "c");
    http::set_header(res, "Content-Length", "0");

    EXPECT_EQ("HTTP/1.1 200 OK\r\n"
              "Content-Type: text/plain\r\n"
              "X-Dup: c\r\n"
              "Server: allium\r\n"
              "Content-Length: 0\r\n"
              "\r\n",
              http::to_response_buffer(res));
}

TEST(request_header_tests, status_line)
{
    HttpResponseHeader res;
    res.set_version_major(1);
    res.set_version_minor(0);
    http::set_status(res, 599, "");
    EXPECT_EQ("HTTP/1.0 599 Unknown\r\n\r\n", http::to_response_buffer(res));

    http::set_status(res, 404, "Gone Fishing");
    EXPECT_EQ("HTTP/1.0 404 Gone Fishing\r\n\r\n", http::to_response_buffer(res));

    EXPECT_STREQ("Payload Too Large", http::reason_phrase(413));
    EXPECT_STREQ("Switching Protocols", http::reason_phrase(101));
}
