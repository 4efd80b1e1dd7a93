#include "http_client.hpp"
#include "../utils/logger.h"

#include <limits>

namespace {

bool is_redirect(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

std::string resolvable_host(const std::string& host) {
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        return host.substr(1, host.size() - 2);
    }
    return host;
}

} // namespace

// One logical upstream request, possibly spanning several connections when
// redirects are followed. Every handler runs on executor_.
class HttpClient::Exchange : public UpstreamCall, public std::enable_shared_from_this<HttpClient::Exchange> {
public:
    Exchange(net::any_io_executor executor, ssl::context& ssl_context,
             UpstreamRequest request, UpstreamHandlers handlers)
        : executor_(std::move(executor)), ssl_context_(ssl_context),
          request_(std::move(request)), handlers_(std::move(handlers)),
          resolver_(executor_), redirects_left_(request_.max_redirects) {}

    void start() {
        net::dispatch(executor_, [self = shared_from_this()]() {
            self->connect(self->request_.url);
        });
    }

    void cancel() override {
        net::dispatch(executor_, [self = shared_from_this()]() {
            self->do_cancel();
        });
    }

private:
    template <class F>
    void with_stream(F&& f) {
        if (tls_) {
            f(*tls_);
        } else if (plain_) {
            f(*plain_);
        }
    }

    void connect(const Url& url) {
        close_stream();
        plain_.reset();
        tls_.reset();
        buffer_.consume(buffer_.size());
        url_ = url;

        auto verb = http::string_to_verb(request_.method);
        if (verb == http::verb::unknown) {
            fail("Unsupported method: " + request_.method);
            return;
        }

        req_ = {};
        req_.version(11);
        req_.method(verb);
        req_.target(url_.request_target());
        req_.set(http::field::host, url_.authority());
        for (const auto& [name, value] : request_.headers) {
            req_.set(name, value);
        }
        req_.set(http::field::connection, "close");

        LOG_DEBUG("Upstream " << request_.method << " " << url_.str());

        resolver_.async_resolve(resolvable_host(url_.host), std::to_string(url_.effective_port()),
            beast::bind_front_handler(&Exchange::on_resolve, shared_from_this()));
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (cancelled_) return;
        if (ec) {
            fail("Failed to resolve host " + url_.host + ": " + ec.message());
            return;
        }

        if (url_.scheme == "https") {
            const std::string host = resolvable_host(url_.host);
            tls_.emplace(executor_, ssl_context_);
            if (!SSL_set_tlsext_host_name(tls_->native_handle(), host.c_str())) {
                fail("Failed to set SNI host name " + host);
                return;
            }
            tls_->set_verify_callback(ssl::host_name_verification(host));
            beast::get_lowest_layer(*tls_).async_connect(results,
                beast::bind_front_handler(&Exchange::on_connect, shared_from_this()));
        } else {
            plain_.emplace(executor_);
            plain_->async_connect(results,
                beast::bind_front_handler(&Exchange::on_connect, shared_from_this()));
        }
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (cancelled_) return;
        if (ec) {
            fail("Failed to connect to " + url_.authority() + ": " + ec.message());
            return;
        }

        if (tls_) {
            tls_->async_handshake(ssl::stream_base::client,
                beast::bind_front_handler(&Exchange::on_handshake, shared_from_this()));
        } else {
            write_request();
        }
    }

    void on_handshake(beast::error_code ec) {
        if (cancelled_) return;
        if (ec) {
            fail("TLS handshake with " + url_.host + " failed: " + ec.message());
            return;
        }
        write_request();
    }

    void write_request() {
        with_stream([this](auto& stream) {
            http::async_write(stream, req_,
                beast::bind_front_handler(&Exchange::on_write, shared_from_this()));
        });
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (cancelled_) return;
        if (ec) {
            fail("Failed to write request: " + ec.message());
            return;
        }

        parser_.emplace();
        parser_->body_limit(std::numeric_limits<std::uint64_t>::max());
        if (req_.method() == http::verb::head) {
            parser_->skip(true);
        }

        with_stream([this](auto& stream) {
            http::async_read_header(stream, buffer_, *parser_,
                beast::bind_front_handler(&Exchange::on_header, shared_from_this()));
        });
    }

    void on_header(beast::error_code ec, std::size_t) {
        if (cancelled_) return;
        if (ec) {
            fail("Failed to read response header: " + ec.message());
            return;
        }

        auto& res = parser_->get();
        int status = static_cast<int>(res.result_int());

        auto location = res.find(http::field::location);
        if (is_redirect(status) && location != res.end()) {
            follow_redirect(status, std::string(location->value()));
            return;
        }

        UpstreamHead head;
        head.status_code = status;
        head.reason = std::string(res.reason());
        for (const auto& field : res) {
            head.headers.emplace_back(std::string(field.name_string()), std::string(field.value()));
        }

        LOG_DEBUG("Upstream " << url_.host << " answered " << status);
        // Handlers may cancel the call, which clears handlers_.
        if (auto on_head = handlers_.on_head) {
            on_head(head);
        }
        continue_body();
    }

    void follow_redirect(int status, const std::string& location) {
        if (redirects_left_ <= 0) {
            fail("Too many redirects");
            return;
        }

        auto next = url_.resolve(location);
        if (!next || (next->scheme != "http" && next->scheme != "https")) {
            fail("Invalid redirect location: " + location);
            return;
        }
        if (request_.redirect_filter) {
            next = request_.redirect_filter(*next, request_.headers);
            if (!next) {
                fail("Redirect from " + url_.host + " refused");
                return;
            }
        }

        --redirects_left_;
        if (status == 303 && request_.method != "HEAD") {
            request_.method = "GET";
        }
        LOG_DEBUG("Following " << status << " redirect to " << next->str());
        connect(*next);
    }

    void continue_body() {
        if (cancelled_ || finished_) return;
        if (parser_->is_done()) {
            complete();
            return;
        }

        parser_->get().body().data = body_buf_.data();
        parser_->get().body().size = body_buf_.size();
        with_stream([this](auto& stream) {
            http::async_read_some(stream, buffer_, *parser_,
                beast::bind_front_handler(&Exchange::on_read, shared_from_this()));
        });
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (cancelled_) return;
        if (ec == http::error::need_buffer) {
            ec = {};
        }
        if (ec) {
            fail("Failed to read response body: " + ec.message());
            return;
        }

        std::size_t len = body_buf_.size() - parser_->get().body().size;
        if (len == 0) {
            continue_body();
            return;
        }

        if (auto on_chunk = handlers_.on_chunk) {
            on_chunk(std::string(body_buf_.data(), len), [self = shared_from_this()]() {
                net::dispatch(self->executor_, [self]() {
                    self->continue_body();
                });
            });
        }
    }

    void complete() {
        if (finished_) return;
        finished_ = true;
        auto handlers = std::move(handlers_);
        handlers_ = {};
        close_stream();
        if (handlers.on_complete) {
            handlers.on_complete();
        }
    }

    void fail(const std::string& error) {
        if (finished_) return;
        finished_ = true;
        auto handlers = std::move(handlers_);
        handlers_ = {};
        close_stream();
        if (handlers.on_error) {
            handlers.on_error(error);
        }
    }

    void do_cancel() {
        if (finished_) return;
        LOG_DEBUG("Upstream call to " << url_.host << " cancelled");
        cancelled_ = true;
        finished_ = true;
        handlers_ = {};
        resolver_.cancel();
        close_stream();
    }

    void close_stream() {
        with_stream([](auto& stream) {
            beast::get_lowest_layer(stream).close();
        });
    }

private:
    net::any_io_executor executor_;
    ssl::context& ssl_context_;
    UpstreamRequest request_;
    UpstreamHandlers handlers_;
    tcp::resolver resolver_;
    std::optional<beast::tcp_stream> plain_;
    std::optional<beast::ssl_stream<beast::tcp_stream>> tls_;
    beast::flat_buffer buffer_;
    http::request<http::empty_body> req_;
    std::optional<http::response_parser<http::buffer_body>> parser_;
    std::array<char, CHUNK_SIZE> body_buf_;
    Url url_;
    int redirects_left_;
    bool cancelled_ = false;
    bool finished_ = false;
};

HttpClient::HttpClient(ssl::context& ssl_context)
    : ssl_context_(ssl_context) {}

std::shared_ptr<UpstreamCall> HttpClient::fetch(net::any_io_executor executor,
                                                UpstreamRequest request,
                                                UpstreamHandlers handlers) {
    auto exchange = std::make_shared<Exchange>(std::move(executor), ssl_context_,
                                               std::move(request), std::move(handlers));
    exchange->start();
    return exchange;
}
