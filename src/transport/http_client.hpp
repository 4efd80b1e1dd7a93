#pragma once

#include "common.h"
#include "url.hpp"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <array>
#include <memory>
#include <functional>
#include <optional>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

struct UpstreamRequest {
    std::string method = "GET";
    Url url;
    HeaderList headers;
    int max_redirects = 20;
    // Decides each redirect hop: returns the URL to connect to, possibly
    // rewritten, and may adjust headers for the next hop. nullopt refuses the
    // hop. Unset means every http(s) hop is followed as given.
    std::function<std::optional<Url>(const Url& next, HeaderList& headers)> redirect_filter;
};

struct UpstreamHead {
    int status_code = 0;
    std::string reason;
    HeaderList headers;
};

// Callbacks for one upstream exchange. on_chunk hands over a piece of the
// body; the next read starts only once read_more is called.
struct UpstreamHandlers {
    std::function<void(const UpstreamHead&)> on_head;
    std::function<void(std::string chunk, std::function<void()> read_more)> on_chunk;
    std::function<void()> on_complete;
    std::function<void(const std::string& error)> on_error;
};

class UpstreamCall {
public:
    virtual ~UpstreamCall() = default;
    // Releases the upstream connection. No handler runs afterwards.
    virtual void cancel() = 0;
};

class UpstreamClient {
public:
    virtual ~UpstreamClient() = default;
    virtual std::shared_ptr<UpstreamCall> fetch(net::any_io_executor executor,
                                                UpstreamRequest request,
                                                UpstreamHandlers handlers) = 0;
};

class HttpClient : public UpstreamClient {
public:
    explicit HttpClient(ssl::context& ssl_context);
    ~HttpClient() override = default;

    std::shared_ptr<UpstreamCall> fetch(net::any_io_executor executor,
                                        UpstreamRequest request,
                                        UpstreamHandlers handlers) override;

    static constexpr std::size_t CHUNK_SIZE = 16 * 1024;

private:
    class Exchange;

    ssl::context& ssl_context_;
};
