#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <boost/asio/io_context.hpp>
#include "adapters/http/beast_client.hpp"

using rfetch::adapters::http::BeastHttpClient;
using rfetch::adapters::http::parse_http_url;
using rfetch::infra::ErrorCode;

TEST(ParseHttpUrlTest, HostPortAndTarget)
{
    auto url = parse_http_url("http://127.0.0.1:8080/some/file?x=1");
    ASSERT_TRUE(url);
    EXPECT_EQ(url->host, "127.0.0.1");
    EXPECT_EQ(url->port, "8080");
    EXPECT_EQ(url->target, "/some/file?x=1");
}

TEST(ParseHttpUrlTest, DefaultsPortAndPath)
{
    auto url = parse_http_url("http://example.com");
    ASSERT_TRUE(url);
    EXPECT_EQ(url->host, "example.com");
    EXPECT_EQ(url->port, "80");
    EXPECT_EQ(url->target, "/");
}

TEST(ParseHttpUrlTest, RejectsUnsupportedUrls)
{
    for (const char* bad : {"https://example.com/", "ftp://example.com/", "example.com/file",
                            "http:///file", "http://host:0/", "http://host:99999/", "http://host:abc/"}) {
        auto url = parse_http_url(bad);
        ASSERT_FALSE(url) << bad;
        EXPECT_EQ(url.error().code, ErrorCode::InvalidArgument) << bad;
    }
}

TEST(BeastHttpClientTest, ConnectFailureIsNetworkFailure)
{
    boost::asio::io_context io;
    BeastHttpClient client(io, "127.0.0.1", "1",
                           rfetch::adapters::http::BeastClientOptions{.timeout = std::chrono::seconds(5)});

    std::optional<rfetch::infra::Result<rfetch::adapters::http::Response>> result;
    auto handle = client.get({.path = "/", .range_start = std::nullopt},
                             [&](rfetch::infra::Result<rfetch::adapters::http::Response> r) {
                                 result = std::move(r);
                             });
    io.run_for(std::chrono::seconds(10));

    ASSERT_TRUE(result);
    ASSERT_FALSE(*result);
    EXPECT_EQ(result->error().code, ErrorCode::NetworkFailure);
    EXPECT_TRUE(result->error().is_transient());
}
