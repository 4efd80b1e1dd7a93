#include "gateway/router.hpp"
#include "core/config.h"
#include "fakes.hpp"

#include <gtest/gtest.h>

namespace {

const std::string NETEASE_TARGET = "https%3A%2F%2Fm701.music.126.net%2F20240101%2Fsong.mp3";

class RouterTest : public ::testing::Test {
protected:
    std::shared_ptr<RecordingSink> handle(const HttpRequest& request) {
        auto sink = std::make_shared<RecordingSink>(io);
        router.handle_request(request, sink);
        return sink;
    }

    boost::asio::io_context io;
    GatewayConfig config;
    FakeUpstreamClient client;
    RequestRouter router{config, client};
};

} // namespace

TEST(RouteTest, ClassifiesRequests) {
    auto classify = [](const std::string& method, const std::string& target) {
        auto request = make_request(method, target);
        return RequestRouter::classify(request, parse_query(request.query()));
    };

    EXPECT_EQ(classify("OPTIONS", "/?target=x"), Route::Preflight);
    EXPECT_EQ(classify("POST", "/?types=search"), Route::MethodNotAllowed);
    EXPECT_EQ(classify("PUT", "/"), Route::MethodNotAllowed);
    EXPECT_EQ(classify("GET", "/?target=" + NETEASE_TARGET), Route::Audio);
    EXPECT_EQ(classify("HEAD", "/?target=" + NETEASE_TARGET), Route::Audio);
    EXPECT_EQ(classify("GET", "/?target=&types=search"), Route::Metadata);
    EXPECT_EQ(classify("GET", "/api"), Route::Metadata);
}

TEST_F(RouterTest, PreflightAnswersWithCorsHeaders) {
    auto sink = handle(make_request("OPTIONS", "/"));
    EXPECT_EQ(sink->status, 204);
    EXPECT_EQ(sink->body, "");
    EXPECT_EQ(sink->header("Access-Control-Allow-Origin"), "*");
    EXPECT_EQ(sink->header("Access-Control-Allow-Methods"), "GET,HEAD,OPTIONS");
    EXPECT_EQ(sink->header("Access-Control-Allow-Headers"), "*");
    EXPECT_EQ(sink->header("Access-Control-Max-Age"), "86400");
    EXPECT_TRUE(client.calls.empty());
}

TEST_F(RouterTest, OtherMethodsAreRejected) {
    auto sink = handle(make_request("POST", "/?types=search&name=x"));
    EXPECT_EQ(sink->status, 405);
    EXPECT_EQ(sink->body, "Method not allowed");
    EXPECT_TRUE(client.calls.empty());
}

TEST_F(RouterTest, DisallowedTargetNeverReachesUpstream) {
    auto sink = handle(make_request("GET", "/?target=https%3A%2F%2Fevil.com%2Fqq.com"));
    EXPECT_EQ(sink->status, 400);
    EXPECT_EQ(sink->body, "Invalid target");
    EXPECT_TRUE(client.calls.empty());

    sink = handle(make_request("GET", "/?target=garbage"));
    EXPECT_EQ(sink->status, 400);
    EXPECT_TRUE(client.calls.empty());
}

TEST_F(RouterTest, AudioRequestForwardsRangeAndUserAgent) {
    auto sink = handle(make_request("GET", "/?target=" + NETEASE_TARGET,
                                    {{"Range", "bytes=0-1023"}, {"User-Agent", "Player/2"},
                                     {"Cookie", "secret=1"}}));

    ASSERT_EQ(client.calls.size(), 1u);
    const UpstreamRequest& upstream = client.last().request;
    EXPECT_EQ(upstream.method, "GET");
    EXPECT_EQ(upstream.url.str(), "https://m701.music.126.net/20240101/song.mp3");
    EXPECT_EQ(*find_header(upstream.headers, "Range"), "bytes=0-1023");
    EXPECT_EQ(*find_header(upstream.headers, "User-Agent"), "Player/2");
    EXPECT_FALSE(has_header(upstream.headers, "Cookie"));
    EXPECT_FALSE(has_header(upstream.headers, "Referer"));
}

TEST_F(RouterTest, KuwoGetsRefererAndPlainHttp) {
    handle(make_request("HEAD", "/?target=https%3A%2F%2Fsy.kuwo.cn%2Fa.mp3"));

    ASSERT_EQ(client.calls.size(), 1u);
    const UpstreamRequest& upstream = client.last().request;
    EXPECT_EQ(upstream.method, "HEAD");
    EXPECT_EQ(upstream.url.str(), "http://sy.kuwo.cn/a.mp3");
    EXPECT_EQ(*find_header(upstream.headers, "Referer"), "https://www.kuwo.cn/");
    EXPECT_EQ(*find_header(upstream.headers, "User-Agent"), "Mozilla/5.0");
}

TEST_F(RouterTest, AudioRedirectsStayOnTheAllowList) {
    handle(make_request("GET", "/?target=" + NETEASE_TARGET));
    const auto& filter = client.last().request.redirect_filter;
    ASSERT_TRUE(filter);

    HeaderList headers = client.last().request.headers;
    auto hop = filter(*Url::parse("https://m8.music.126.net/other.mp3"), headers);
    ASSERT_TRUE(hop);
    EXPECT_EQ(hop->str(), "https://m8.music.126.net/other.mp3");

    EXPECT_FALSE(filter(*Url::parse("http://169.254.169.254/latest"), headers));
    EXPECT_FALSE(filter(*Url::parse("https://evil.com/qq.com"), headers));
}

TEST_F(RouterTest, RedirectToKuwoIsRewrittenLikeADirectTarget) {
    handle(make_request("GET", "/?target=" + NETEASE_TARGET));
    const UpstreamRequest& upstream = client.last().request;
    HeaderList headers = upstream.headers;
    ASSERT_FALSE(has_header(headers, "Referer"));

    auto hop = upstream.redirect_filter(*Url::parse("https://x.kuwo.cn/a.mp3"), headers);
    ASSERT_TRUE(hop);
    EXPECT_EQ(hop->str(), "http://x.kuwo.cn/a.mp3");
    EXPECT_EQ(*find_header(headers, "Referer"), "https://www.kuwo.cn/");
}

TEST_F(RouterTest, RedirectAwayFromKuwoDropsReferer) {
    handle(make_request("GET", "/?target=https%3A%2F%2Fsy.kuwo.cn%2Fa.mp3"));
    const UpstreamRequest& upstream = client.last().request;
    HeaderList headers = upstream.headers;
    ASSERT_TRUE(has_header(headers, "Referer"));

    auto hop = upstream.redirect_filter(*Url::parse("https://m8.music.126.net/a.mp3"), headers);
    ASSERT_TRUE(hop);
    EXPECT_EQ(hop->scheme, "https");
    EXPECT_FALSE(has_header(headers, "Referer"));
    EXPECT_TRUE(has_header(headers, "User-Agent"));
}

TEST_F(RouterTest, PartialContentIsRelayedWithExposedHeaders) {
    auto sink = handle(make_request("GET", "/?target=" + NETEASE_TARGET, {{"Range", "bytes=0-3"}}));
    FakeCall& call = client.last();

    call.respond_head(206, {
        {"Content-Type", "audio/mpeg"},
        {"Content-Range", "bytes 0-3/100"},
        {"Content-Length", "4"},
        {"Accept-Ranges", "bytes"},
        {"Set-Cookie", "tracking=1"},
        {"X-Powered-By", "cdn"},
    });

    EXPECT_EQ(sink->status, 206);
    EXPECT_EQ(sink->header("Content-Range"), "bytes 0-3/100");
    EXPECT_EQ(sink->header("Content-Length"), "4");
    EXPECT_EQ(sink->header("Accept-Ranges"), "bytes");
    EXPECT_EQ(sink->header("Cache-Control"), "no-store");
    EXPECT_EQ(sink->header("Access-Control-Allow-Origin"), "*");
    EXPECT_EQ(sink->header("Access-Control-Allow-Methods"), "GET,HEAD,OPTIONS");
    EXPECT_EQ(sink->header("Access-Control-Expose-Headers"), "Content-Range, Content-Length, Accept-Ranges");
    EXPECT_EQ(sink->header("Set-Cookie"), "");
    EXPECT_EQ(sink->header("X-Powered-By"), "");
}

TEST_F(RouterTest, UpstreamErrorStatusIsRelayedUnchanged) {
    auto sink = handle(make_request("GET", "/?target=" + NETEASE_TARGET));
    FakeCall& call = client.last();
    call.respond_head(404, {{"Cache-Control", "max-age=10"}});
    call.respond_complete();

    EXPECT_EQ(sink->status, 404);
    EXPECT_EQ(sink->header("Cache-Control"), "max-age=10");
    EXPECT_TRUE(sink->finished);
}

TEST_F(RouterTest, NextReadWaitsForDownstreamWrite) {
    auto sink = handle(make_request("GET", "/?target=" + NETEASE_TARGET));
    FakeCall& call = client.last();

    call.respond_head(200, {{"Content-Type", "audio/mpeg"}});
    call.respond_chunk("abc");
    EXPECT_EQ(call.reads_requested, 0);

    sink->complete_write(true);
    EXPECT_EQ(call.reads_requested, 1);

    call.respond_chunk("def");
    sink->complete_write(true);
    call.respond_complete();

    EXPECT_EQ(call.reads_requested, 2);
    EXPECT_EQ(sink->body, "abcdef");
    EXPECT_TRUE(sink->finished);
    EXPECT_FALSE(call.cancelled);
}

TEST_F(RouterTest, ClientDisconnectCancelsUpstream) {
    auto sink = handle(make_request("GET", "/?target=" + NETEASE_TARGET));
    FakeCall& call = client.last();

    call.respond_head(200, {});
    call.respond_chunk("abc");
    sink->client_gone();
    EXPECT_TRUE(call.cancelled);
}

TEST_F(RouterTest, FailedWriteCancelsUpstream) {
    auto sink = handle(make_request("GET", "/?target=" + NETEASE_TARGET));
    FakeCall& call = client.last();

    call.respond_head(200, {});
    call.respond_chunk("abc");
    sink->complete_write(false);
    EXPECT_TRUE(call.cancelled);
    EXPECT_EQ(call.reads_requested, 0);
}

TEST_F(RouterTest, UpstreamFailureBeforeHeadIsBadGateway) {
    auto sink = handle(make_request("GET", "/?types=search&name=x"));
    client.last().respond_error("Failed to resolve host api.i-meto.com");

    EXPECT_EQ(sink->status, 502);
    EXPECT_EQ(nlohmann::json::parse(sink->body),
              nlohmann::json::parse(R"({"error":true,"code":502,"message":"Bad gateway"})"));
    EXPECT_EQ(sink->header("Access-Control-Allow-Origin"), "*");
    EXPECT_FALSE(sink->aborted);
}

TEST_F(RouterTest, UpstreamFailureMidBodyAbortsResponse) {
    auto sink = handle(make_request("GET", "/?target=" + NETEASE_TARGET));
    FakeCall& call = client.last();

    call.respond_head(200, {{"Content-Length", "100"}});
    call.respond_chunk("abc");
    sink->complete_write(true);
    call.respond_error("connection reset");

    EXPECT_EQ(sink->status, 200);
    EXPECT_TRUE(sink->aborted);
    EXPECT_FALSE(sink->finished);
}

TEST_F(RouterTest, MetadataRequestGoesToConfiguredApi) {
    handle(make_request("GET", "/?types=url&id=12345&source=netease"));
    ASSERT_EQ(client.calls.size(), 1u);
    EXPECT_EQ(client.last().request.url.str(),
              "https://api.i-meto.com/meting/api?server=netease&type=url&id=12345"
              "&auth=f4b7754fb9527cd423cd93f297420735fa7f8999");
}

TEST_F(RouterTest, RejectedTargetCannotForgeLogLines) {
    Logger::instance().set_level(LogLevel::Info);
    ::testing::internal::CaptureStderr();
    auto sink = handle(make_request("GET", "/?target=http%3A%2F%2Fevil.com%2F%0D%0A2026-01-01%20[ERROR]%20forged"));
    std::string log = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(sink->status, 400);
    EXPECT_NE(log.find("\\x0d\\x0a2026-01-01 [ERROR] forged"), std::string::npos) << log;
    EXPECT_EQ(log.find("\n2026-01-01 [ERROR]"), std::string::npos) << log;
}
