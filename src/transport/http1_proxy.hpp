#pragma once

#include "common.h"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include <deque>
#include <memory>
#include <optional>
#include <string>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class Http1ResponseSink;

// One browser connection. Requests are answered in order; the next request is
// read once the previous response has been written completely.
class Http1ProxySession : public std::enable_shared_from_this<Http1ProxySession> {
public:
    explicit Http1ProxySession(tcp::socket socket, RequestCB request_cb);
    ~Http1ProxySession();

    void start();

private:
    friend class Http1ResponseSink;

    void read_request();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void on_response_done(bool keep_alive);
    void close();

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    RequestCB request_cb_;
};

// ResponseSink writing to an HTTP/1.1 connection. Streamed bodies use the
// forwarded Content-Length when there is one and chunked coding otherwise.
class Http1ResponseSink : public ResponseSink, public std::enable_shared_from_this<Http1ResponseSink> {
public:
    Http1ResponseSink(std::shared_ptr<Http1ProxySession> session, unsigned version, bool keep_alive, bool head_only);

    void send(const HttpResponse& response) override;
    void send_head(int status, const std::string& reason, const HeaderList& headers) override;
    void send_chunk(std::string chunk, WriteCallback on_written) override;
    void finish() override;
    void abort() override;
    void set_abort_handler(std::function<void()> handler) override;
    bool head_sent() const override { return head_sent_; }
    net::any_io_executor get_executor() override;

private:
    struct PendingChunk {
        std::string data;
        WriteCallback on_written;
    };

    void pump();
    void on_head_written(beast::error_code ec, std::size_t);
    void on_chunk_written(beast::error_code ec, std::size_t);
    void on_last_written(beast::error_code ec, std::size_t);
    void complete(beast::error_code ec);
    void fail(const std::string& what, beast::error_code ec);
    void post_callback(WriteCallback cb, bool ok);

    std::shared_ptr<Http1ProxySession> session_;
    unsigned version_;
    bool keep_alive_;
    bool head_only_;

    bool head_sent_ = false;
    bool head_written_ = false;
    bool bodyless_ = false;
    bool finishing_ = false;
    bool writing_ = false;
    bool closed_ = false;
    bool done_ = false;

    std::optional<http::response<http::buffer_body>> response_;
    std::optional<http::response_serializer<http::buffer_body>> serializer_;
    std::deque<PendingChunk> queue_;
    PendingChunk current_;
    std::function<void()> abort_handler_;
};

class Http1ProxyServer {
public:
    explicit Http1ProxyServer(net::io_context& io_context, int port);
    void start();
    void set_request_handler(RequestCB handler);
    // Bound port; differs from the requested one when that was 0.
    unsigned short local_port() const { return acceptor_.local_endpoint().port(); }

private:
    void accept_connections();

    net::io_context& io_context_;
    tcp::acceptor acceptor_;
    RequestCB request_handler_;
};
