#include "transport/http_client.hpp"
#include "loopback.hpp"

#include <gtest/gtest.h>

namespace {

struct Outcome {
    int heads = 0;
    int status = 0;
    HeaderList headers;
    int chunks = 0;
    std::string body;
    bool completed = false;
    std::string error;

    bool settled() const { return completed || !error.empty(); }
};

UpstreamHandlers collect(Outcome& out) {
    UpstreamHandlers handlers;
    handlers.on_head = [&out](const UpstreamHead& head) {
        ++out.heads;
        out.status = head.status_code;
        out.headers = head.headers;
    };
    handlers.on_chunk = [&out](std::string chunk, std::function<void()> read_more) {
        ++out.chunks;
        out.body += chunk;
        read_more();
    };
    handlers.on_complete = [&out]() { out.completed = true; };
    handlers.on_error = [&out](const std::string& error) { out.error = error; };
    return handlers;
}

const char* REDIRECT_TO_FINAL = "HTTP/1.1 302 Found\r\nLocation: /final\r\nContent-Length: 0\r\n\r\n";
const char* HELLO = "HTTP/1.1 200 OK\r\nContent-Type: audio/mpeg\r\nContent-Length: 5\r\n\r\nhello";

class HttpClientTest : public ::testing::Test {
protected:
    UpstreamRequest request_for(const loopback::Server& server, const std::string& path) {
        UpstreamRequest request;
        request.url = *Url::parse(server.url(path));
        request.headers = {{"User-Agent", "TestAgent/1.0"}};
        return request;
    }

    net::io_context io;
    ssl::context tls{ssl::context::tls_client};
    HttpClient client{tls};
};

} // namespace

TEST_F(HttpClientTest, StreamsPlainResponse) {
    loopback::Server server(io, [](const loopback::ReceivedRequest&) {
        return loopback::Server::Answer{HELLO};
    });

    Outcome out;
    client.fetch(io.get_executor(), request_for(server, "/song.mp3?x=1"), collect(out));
    ASSERT_TRUE(loopback::run_until(io, [&] { return out.settled(); }));

    EXPECT_TRUE(out.completed) << out.error;
    EXPECT_EQ(out.status, 200);
    EXPECT_EQ(*find_header(out.headers, "Content-Type"), "audio/mpeg");
    EXPECT_EQ(out.body, "hello");

    ASSERT_EQ(server.requests.size(), 1u);
    const auto& received = server.requests[0];
    EXPECT_EQ(received.method, "GET");
    EXPECT_EQ(received.target, "/song.mp3?x=1");
    EXPECT_EQ(*find_header(received.headers, "User-Agent"), "TestAgent/1.0");
    EXPECT_EQ(*find_header(received.headers, "Host"), "127.0.0.1:" + std::to_string(server.port()));
}

TEST_F(HttpClientTest, FollowsRedirectTransparently) {
    loopback::Server server(io, [](const loopback::ReceivedRequest& request) {
        return loopback::Server::Answer{request.target == "/start" ? REDIRECT_TO_FINAL : HELLO};
    });

    Outcome out;
    client.fetch(io.get_executor(), request_for(server, "/start"), collect(out));
    ASSERT_TRUE(loopback::run_until(io, [&] { return out.settled(); }));

    EXPECT_TRUE(out.completed) << out.error;
    EXPECT_EQ(out.heads, 1);
    EXPECT_EQ(out.status, 200);
    EXPECT_EQ(out.body, "hello");
    ASSERT_EQ(server.requests.size(), 2u);
    EXPECT_EQ(server.requests[1].target, "/final");
}

TEST_F(HttpClientTest, RedirectLimitIsAnError) {
    loopback::Server server(io, [](const loopback::ReceivedRequest&) {
        return loopback::Server::Answer{"HTTP/1.1 302 Found\r\nLocation: /again\r\nContent-Length: 0\r\n\r\n"};
    });

    Outcome out;
    auto request = request_for(server, "/start");
    request.max_redirects = 2;
    client.fetch(io.get_executor(), std::move(request), collect(out));
    ASSERT_TRUE(loopback::run_until(io, [&] { return out.settled(); }));

    EXPECT_FALSE(out.completed);
    EXPECT_EQ(out.error, "Too many redirects");
    EXPECT_EQ(out.heads, 0);
    EXPECT_EQ(server.requests.size(), 3u);
}

TEST_F(HttpClientTest, RefusedRedirectIsAnError) {
    loopback::Server server(io, [](const loopback::ReceivedRequest&) {
        return loopback::Server::Answer{REDIRECT_TO_FINAL};
    });

    Outcome out;
    auto request = request_for(server, "/start");
    request.redirect_filter = [](const Url&, HeaderList&) -> std::optional<Url> { return std::nullopt; };
    client.fetch(io.get_executor(), std::move(request), collect(out));
    ASSERT_TRUE(loopback::run_until(io, [&] { return out.settled(); }));

    EXPECT_FALSE(out.completed);
    EXPECT_FALSE(out.error.empty());
    EXPECT_EQ(out.heads, 0);
    EXPECT_EQ(server.requests.size(), 1u);
}

TEST_F(HttpClientTest, RedirectFilterRewritesNextHop) {
    loopback::Server server(io, [](const loopback::ReceivedRequest& request) {
        return loopback::Server::Answer{request.target == "/start" ? REDIRECT_TO_FINAL : HELLO};
    });

    Url seen;
    Outcome out;
    auto request = request_for(server, "/start");
    request.redirect_filter = [&seen](const Url& next, HeaderList& headers) -> std::optional<Url> {
        seen = next;
        set_header(headers, "Referer", "https://www.kuwo.cn/");
        Url rewritten = next;
        rewritten.query = "rewritten=1";
        return rewritten;
    };
    client.fetch(io.get_executor(), std::move(request), collect(out));
    ASSERT_TRUE(loopback::run_until(io, [&] { return out.settled(); }));

    EXPECT_TRUE(out.completed) << out.error;
    EXPECT_EQ(seen.path, "/final");
    ASSERT_EQ(server.requests.size(), 2u);
    EXPECT_FALSE(has_header(server.requests[0].headers, "Referer"));
    EXPECT_EQ(server.requests[1].target, "/final?rewritten=1");
    EXPECT_EQ(*find_header(server.requests[1].headers, "Referer"), "https://www.kuwo.cn/");
}

TEST_F(HttpClientTest, HeadDeliversNoBody) {
    loopback::Server server(io, [](const loopback::ReceivedRequest&) {
        return loopback::Server::Answer{"HTTP/1.1 200 OK\r\nContent-Type: audio/mpeg\r\nContent-Length: 5\r\n\r\n"};
    });

    Outcome out;
    auto request = request_for(server, "/song.mp3");
    request.method = "HEAD";
    client.fetch(io.get_executor(), std::move(request), collect(out));
    ASSERT_TRUE(loopback::run_until(io, [&] { return out.settled(); }));

    EXPECT_TRUE(out.completed) << out.error;
    EXPECT_EQ(*find_header(out.headers, "Content-Length"), "5");
    EXPECT_EQ(out.chunks, 0);
    EXPECT_EQ(out.body, "");
    ASSERT_EQ(server.requests.size(), 1u);
    EXPECT_EQ(server.requests[0].method, "HEAD");
}

TEST_F(HttpClientTest, CancelReleasesConnectionAndSilencesHandlers) {
    loopback::Server server(io, [](const loopback::ReceivedRequest&) {
        return loopback::Server::Answer{
            "HTTP/1.1 200 OK\r\nContent-Length: 100000\r\n\r\n" + std::string(1000, 'a'), true};
    });

    Outcome out;
    std::shared_ptr<UpstreamCall> call;
    UpstreamHandlers handlers = collect(out);
    handlers.on_chunk = [&out, &call](std::string chunk, std::function<void()>) {
        ++out.chunks;
        out.body += chunk;
        call->cancel();
    };
    call = client.fetch(io.get_executor(), request_for(server, "/big.mp3"), std::move(handlers));

    ASSERT_TRUE(loopback::run_until(io, [&] { return server.peer_closed; }));
    io.poll();

    EXPECT_EQ(out.heads, 1);
    EXPECT_EQ(out.chunks, 1);
    EXPECT_FALSE(out.body.empty());
    EXPECT_FALSE(out.completed);
    EXPECT_TRUE(out.error.empty());
}

TEST_F(HttpClientTest, ConnectionFailureIsAnError) {
    unsigned short closed_port = 0;
    {
        tcp::acceptor unused(io, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        closed_port = unused.local_endpoint().port();
    }

    Outcome out;
    UpstreamRequest request;
    request.url = *Url::parse("http://127.0.0.1:" + std::to_string(closed_port) + "/");
    client.fetch(io.get_executor(), std::move(request), collect(out));
    ASSERT_TRUE(loopback::run_until(io, [&] { return out.settled(); }));

    EXPECT_FALSE(out.completed);
    EXPECT_NE(out.error.find("Failed to connect"), std::string::npos) << out.error;
}
