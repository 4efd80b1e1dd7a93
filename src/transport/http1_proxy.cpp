#include "http1_proxy.hpp"
#include "../utils/logger.h"

Http1ProxySession::Http1ProxySession(tcp::socket socket, RequestCB request_cb)
    : stream_(std::move(socket)), request_cb_(std::move(request_cb)) {
    LOG_DEBUG("HTTP/1.1 session opened");
}

Http1ProxySession::~Http1ProxySession() {
    LOG_DEBUG("HTTP/1.1 session closed");
}

void Http1ProxySession::start() {
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&Http1ProxySession::read_request, shared_from_this()));
}

void Http1ProxySession::read_request() {
    request_ = {};
    http::async_read(stream_, buffer_, request_,
        beast::bind_front_handler(&Http1ProxySession::on_read, shared_from_this()));
}

void Http1ProxySession::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        close();
        return;
    }
    if (ec) {
        LOG_DEBUG("HTTP/1.1 read error: " << ec.message());
        return;
    }

    HttpRequest request;
    request.method = std::string(request_.method_string());
    request.target = std::string(request_.target());
    for (const auto& field : request_) {
        request.headers.emplace_back(std::string(field.name_string()), std::string(field.value()));
    }

    LOG_DEBUG("HTTP/1.1 " << request.method << " " << request.target);

    auto sink = std::make_shared<Http1ResponseSink>(shared_from_this(), request_.version(),
                                                    request_.keep_alive(), request.method == "HEAD");
    request_cb_(request, sink);
}

void Http1ProxySession::on_response_done(bool keep_alive) {
    if (keep_alive) {
        read_request();
    } else {
        close();
    }
}

void Http1ProxySession::close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    stream_.close();
}

Http1ResponseSink::Http1ResponseSink(std::shared_ptr<Http1ProxySession> session, unsigned version,
                                     bool keep_alive, bool head_only)
    : session_(std::move(session)), version_(version), keep_alive_(keep_alive), head_only_(head_only) {}

net::any_io_executor Http1ResponseSink::get_executor() {
    return session_->stream_.get_executor();
}

void Http1ResponseSink::set_abort_handler(std::function<void()> handler) {
    abort_handler_ = std::move(handler);
}

void Http1ResponseSink::send(const HttpResponse& response) {
    if (head_sent_ || closed_) {
        return;
    }
    head_sent_ = true;

    auto res = std::make_shared<http::response<http::string_body>>(
        static_cast<http::status>(response.status_code), version_);
    if (!response.reason.empty()) {
        res->reason(response.reason);
    }
    res->set(http::field::server, "meting-gateway");
    for (const auto& [name, value] : response.headers) {
        res->set(name, value);
    }
    res->keep_alive(keep_alive_);

    int status = response.status_code;
    if (head_only_) {
        res->content_length(response.body.size());
    } else if (status != 204 && status != 304 && status >= 200) {
        res->body() = response.body;
        res->prepare_payload();
    }

    LOG_INFO("Responded " << status);

    auto self = shared_from_this();
    http::async_write(session_->stream_, *res, [self, res](beast::error_code ec, std::size_t) {
        self->complete(ec);
    });
}

void Http1ResponseSink::send_head(int status, const std::string& reason, const HeaderList& headers) {
    if (head_sent_ || closed_) {
        return;
    }
    head_sent_ = true;

    response_.emplace(static_cast<http::status>(status), version_);
    if (!reason.empty()) {
        response_->reason(reason);
    }
    response_->set(http::field::server, "meting-gateway");
    for (const auto& [name, value] : headers) {
        response_->set(name, value);
    }
    response_->keep_alive(keep_alive_);

    bodyless_ = head_only_ || status == 204 || status == 304 || status < 200;
    if (!bodyless_ && !has_header(headers, "Content-Length")) {
        response_->chunked(true);
    }
    response_->body().data = nullptr;
    response_->body().size = 0;
    response_->body().more = true;
    serializer_.emplace(*response_);

    LOG_INFO("Relaying " << status << (response_->chunked() ? " (chunked)" : ""));
    pump();
}

void Http1ResponseSink::send_chunk(std::string chunk, WriteCallback on_written) {
    if (closed_) {
        post_callback(std::move(on_written), false);
        return;
    }
    if (bodyless_) {
        post_callback(std::move(on_written), true);
        return;
    }
    queue_.push_back({std::move(chunk), std::move(on_written)});
    pump();
}

void Http1ResponseSink::finish() {
    finishing_ = true;
    pump();
}

void Http1ResponseSink::abort() {
    if (closed_ || done_) {
        return;
    }
    LOG_WARN("Aborting HTTP/1.1 response");
    closed_ = true;
    abort_handler_ = nullptr;
    for (auto& pending : queue_) {
        post_callback(std::move(pending.on_written), false);
    }
    queue_.clear();
    session_->close();
}

void Http1ResponseSink::pump() {
    if (writing_ || closed_ || done_ || !serializer_) {
        return;
    }

    if (!head_written_) {
        writing_ = true;
        http::async_write_header(session_->stream_, *serializer_,
            beast::bind_front_handler(&Http1ResponseSink::on_head_written, shared_from_this()));
        return;
    }

    if (bodyless_) {
        if (finishing_) {
            complete({});
        }
        return;
    }

    if (!queue_.empty()) {
        current_ = std::move(queue_.front());
        queue_.pop_front();
        response_->body().data = current_.data.data();
        response_->body().size = current_.data.size();
        response_->body().more = true;
        writing_ = true;
        http::async_write(session_->stream_, *serializer_,
            beast::bind_front_handler(&Http1ResponseSink::on_chunk_written, shared_from_this()));
        return;
    }

    if (finishing_) {
        response_->body().data = nullptr;
        response_->body().size = 0;
        response_->body().more = false;
        writing_ = true;
        http::async_write(session_->stream_, *serializer_,
            beast::bind_front_handler(&Http1ResponseSink::on_last_written, shared_from_this()));
    }
}

void Http1ResponseSink::on_head_written(beast::error_code ec, std::size_t) {
    writing_ = false;
    if (ec) {
        fail("header write", ec);
        return;
    }
    head_written_ = true;
    pump();
}

void Http1ResponseSink::on_chunk_written(beast::error_code ec, std::size_t) {
    writing_ = false;
    if (ec == http::error::need_buffer) {
        ec = {};
    }
    if (ec) {
        fail("body write", ec);
        return;
    }

    auto on_written = std::move(current_.on_written);
    current_ = {};
    if (on_written) {
        on_written(true);
    }
    pump();
}

void Http1ResponseSink::on_last_written(beast::error_code ec, std::size_t) {
    writing_ = false;
    if (ec == http::error::need_buffer) {
        ec = {};
    }
    complete(ec);
}

void Http1ResponseSink::complete(beast::error_code ec) {
    if (ec) {
        fail("response write", ec);
        return;
    }
    done_ = true;
    abort_handler_ = nullptr;
    session_->on_response_done(keep_alive_);
}

void Http1ResponseSink::fail(const std::string& what, beast::error_code ec) {
    if (closed_) {
        return;
    }
    LOG_DEBUG("HTTP/1.1 " << what << " failed: " << ec.message());
    closed_ = true;

    if (current_.on_written) {
        post_callback(std::move(current_.on_written), false);
    }
    for (auto& pending : queue_) {
        post_callback(std::move(pending.on_written), false);
    }
    queue_.clear();

    if (auto handler = std::move(abort_handler_)) {
        abort_handler_ = nullptr;
        handler();
    }
    session_->close();
}

void Http1ResponseSink::post_callback(WriteCallback cb, bool ok) {
    if (!cb) {
        return;
    }
    net::post(get_executor(), [cb = std::move(cb), ok]() { cb(ok); });
}

Http1ProxyServer::Http1ProxyServer(net::io_context& io_context, int port)
    : io_context_(io_context), acceptor_(io_context, tcp::endpoint(tcp::v4(), port)) {}

void Http1ProxyServer::start() {
    LOG_INFO("Starting HTTP/1.1 server");
    accept_connections();
}

void Http1ProxyServer::set_request_handler(RequestCB handler) {
    request_handler_ = std::move(handler);
}

void Http1ProxyServer::accept_connections() {
    acceptor_.async_accept(net::make_strand(io_context_),
        [this](beast::error_code ec, tcp::socket socket) {
            if (!ec) {
                LOG_DEBUG("HTTP/1.1 connection accepted");
                std::make_shared<Http1ProxySession>(std::move(socket), request_handler_)->start();
            } else {
                LOG_ERROR("HTTP/1.1 accept error: " << ec.message());
            }
            accept_connections();
        });
}
