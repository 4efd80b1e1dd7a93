#include "session.h"

#include <cstring>

namespace {

constexpr size_t MAX_WRITE_BATCH = 64 * 1024;

// Connection-specific fields are not allowed in HTTP/2.
bool is_connection_header(const std::string& name) {
    return name == "connection" || name == "keep-alive" || name == "proxy-connection" ||
           name == "transfer-encoding" || name == "upgrade" || name == "host";
}

} // namespace

Session::Session(boost::asio::ip::tcp::socket p_socket, RequestCB p_request_cb)
    : request_cb_(std::move(p_request_cb)), use_ssl_(false) {
    plain_socket_ = std::make_unique<boost::asio::ip::tcp::socket>(std::move(p_socket));
}

Session::Session(boost::asio::ip::tcp::socket p_socket, boost::asio::ssl::context& ssl_context, RequestCB p_request_cb)
    : request_cb_(std::move(p_request_cb)), use_ssl_(true) {
    ssl_socket_ = std::make_unique<boost::asio::ssl::stream<boost::asio::ip::tcp::socket>>(std::move(p_socket), ssl_context);
}

Session::~Session() {
    if (session_) {
        nghttp2_session_del(session_);
    }
    LOG_DEBUG("HTTP/2 session destroyed");
}

boost::asio::any_io_executor Session::executor() {
    return use_ssl_ ? ssl_socket_->get_executor() : plain_socket_->get_executor();
}

void Session::start() {
    LOG_DEBUG("Start nghttp2 session");
    if (use_ssl_) {
        handle_ssl_handshake();
    } else {
        setup_nghttp2();
        write_data();
        read_data();
    }
}

void Session::handle_ssl_handshake() {
    auto self(shared_from_this());
    ssl_socket_->async_handshake(boost::asio::ssl::stream_base::server,
        [this, self](boost::system::error_code ec) {
            if (!ec) {
                LOG_DEBUG("SSL handshake completed");
                setup_nghttp2();
                write_data();
                read_data();
            } else {
                LOG_ERROR("SSL handshake failed: " << ec.message());
            }
        });
}

void Session::setup_nghttp2() {
    nghttp2_session_callbacks* callbacks;
    nghttp2_session_callbacks_new(&callbacks);

    nghttp2_session_callbacks_set_on_frame_recv_callback(callbacks, on_frame_recv_cb);
    nghttp2_session_callbacks_set_on_header_callback(callbacks, on_header_cb);
    nghttp2_session_callbacks_set_on_data_chunk_recv_callback(callbacks, on_data_chunk_recv_cb);
    nghttp2_session_callbacks_set_on_stream_close_callback(callbacks, on_stream_close_cb);

    int rv = nghttp2_session_server_new(&session_, callbacks, this);
    nghttp2_session_callbacks_del(callbacks);
    if (rv != 0) {
        LOG_ERROR("Failed to create nghttp2 session: " << nghttp2_strerror(rv));
        shutdown();
        return;
    }

    // Send initial SETTINGS frame
    nghttp2_settings_entry iv[1] = {
        {NGHTTP2_SETTINGS_MAX_CONCURRENT_STREAMS, 100}
    };
    rv = nghttp2_submit_settings(session_, NGHTTP2_FLAG_NONE, iv, 1);
    if (rv != 0) {
        LOG_ERROR("Failed to submit settings: " << nghttp2_strerror(rv));
    }
}

void Session::read_data() {
    if (closed_) {
        return;
    }
    auto self(shared_from_this());
    auto on_read = [this, self](boost::system::error_code ec, std::size_t length) {
        if (ec) {
            LOG_DEBUG("HTTP/2 connection closed: " << ec.message());
            shutdown();
            return;
        }
        ssize_t read = nghttp2_session_mem_recv(session_, read_buffer_.data(), length);
        if (read < 0) {
            LOG_ERROR("nghttp2_session_mem_recv error: " << nghttp2_strerror((int)read));
            shutdown();
            return;
        }
        write_data();
        read_data();
    };

    if (use_ssl_) {
        ssl_socket_->async_read_some(boost::asio::buffer(read_buffer_), on_read);
    } else {
        plain_socket_->async_read_some(boost::asio::buffer(read_buffer_), on_read);
    }
}

void Session::write_data() {
    if (writing_ || closed_ || !session_) {
        return;
    }

    write_buffer_.clear();
    while (write_buffer_.size() < MAX_WRITE_BATCH) {
        const uint8_t* data = nullptr;
        ssize_t n = nghttp2_session_mem_send(session_, &data);
        if (n < 0) {
            LOG_ERROR("nghttp2_session_mem_send failed: " << nghttp2_strerror((int)n));
            shutdown();
            return;
        }
        if (n == 0) {
            break;
        }
        write_buffer_.append(reinterpret_cast<const char*>(data), static_cast<size_t>(n));
    }

    if (write_buffer_.empty()) {
        if (!nghttp2_session_want_read(session_) && !nghttp2_session_want_write(session_)) {
            shutdown();
        }
        return;
    }

    writing_ = true;
    auto self(shared_from_this());
    auto on_write = [this, self](boost::system::error_code ec, std::size_t) {
        writing_ = false;
        if (ec) {
            LOG_ERROR("Write error: " << ec.message());
            shutdown();
            return;
        }
        write_data();
    };

    if (use_ssl_) {
        boost::asio::async_write(*ssl_socket_, boost::asio::buffer(write_buffer_), on_write);
    } else {
        boost::asio::async_write(*plain_socket_, boost::asio::buffer(write_buffer_), on_write);
    }
}

void Session::shutdown() {
    if (closed_) {
        return;
    }
    closed_ = true;

    // Clients of unfinished streams must release their upstream calls.
    auto streams = std::move(streams_data_);
    streams_data_.clear();
    for (auto& [stream_id, stream_data] : streams) {
        if (stream_data.sink) {
            stream_data.sink->on_stream_closed();
        }
    }

    boost::system::error_code ec;
    if (use_ssl_) {
        ssl_socket_->lowest_layer().close(ec);
    } else {
        plain_socket_->close(ec);
    }
}

void Session::dispatch_request(int32_t p_stream_id) {
    auto it = streams_data_.find(p_stream_id);
    if (it == streams_data_.end() || it->second.dispatched) {
        return;
    }
    auto& stream_data = it->second;
    stream_data.dispatched = true;

    HttpRequest request;
    request.method = stream_data.method;
    request.target = stream_data.path;
    request.headers = stream_data.headers;
    if (!stream_data.authority.empty()) {
        request.headers.emplace_back("host", stream_data.authority);
    }

    auto sink = std::make_shared<Http2ResponseSink>(weak_from_this(), p_stream_id,
                                                    request.method == "HEAD", executor());
    stream_data.sink = sink;

    LOG_DEBUG("Processing complete request " << request.method << " " << request.target
              << " on stream " << p_stream_id);

    // Leave the nghttp2 callback before any response is submitted.
    auto self(shared_from_this());
    boost::asio::post(executor(), [self, request = std::move(request), sink]() {
        if (!self->closed_) {
            self->request_cb_(request, sink);
        }
    });
}

void Session::submit_response(int32_t p_stream_id, int p_status, const HeaderList& p_headers,
                              Http2ResponseSink* p_body_source) {
    if (closed_) {
        return;
    }

    std::vector<std::pair<std::string, std::string>> fields;
    fields.reserve(p_headers.size() + 1);
    fields.emplace_back(":status", std::to_string(p_status));
    for (const auto& [name, value] : p_headers) {
        std::string lower = to_lower(name);
        if (!is_connection_header(lower)) {
            fields.emplace_back(std::move(lower), value);
        }
    }

    std::vector<nghttp2_nv> nva;
    nva.reserve(fields.size());
    for (const auto& [name, value] : fields) {
        nva.push_back(make_nv(name, value));
    }

    nghttp2_data_provider data_prd;
    data_prd.source.ptr = p_body_source;
    data_prd.read_callback = data_source_read_cb;

    int rv = nghttp2_submit_response(session_, p_stream_id, nva.data(), nva.size(),
                                     p_body_source ? &data_prd : nullptr);
    if (rv != 0) {
        LOG_ERROR("nghttp2_submit_response failed on stream " << p_stream_id << ": " << nghttp2_strerror(rv));
        reset_stream(p_stream_id);
        return;
    }
    LOG_DEBUG("Response head sent on stream " << p_stream_id << " with status " << p_status);
    write_data();
}

void Session::resume_stream(int32_t p_stream_id) {
    if (closed_) {
        return;
    }
    nghttp2_session_resume_data(session_, p_stream_id);
    write_data();
}

void Session::reset_stream(int32_t p_stream_id) {
    if (closed_) {
        return;
    }
    nghttp2_submit_rst_stream(session_, NGHTTP2_FLAG_NONE, p_stream_id, NGHTTP2_INTERNAL_ERROR);
    write_data();
}

// Static callbacks
int Session::on_frame_recv_cb(nghttp2_session* session, const nghttp2_frame* frame,
                                    void* user_data) {
    Session* sess = static_cast<Session*>(user_data);

    bool request_frame = (frame->hd.type == NGHTTP2_HEADERS && frame->headers.cat == NGHTTP2_HCAT_REQUEST) ||
                         frame->hd.type == NGHTTP2_DATA;
    if (request_frame && (frame->hd.flags & NGHTTP2_FLAG_END_STREAM)) {
        sess->dispatch_request(frame->hd.stream_id);
    }
    return 0;
}

int Session::on_header_cb(nghttp2_session* session, const nghttp2_frame* frame,
                            const uint8_t* name, size_t namelen, const uint8_t* value, size_t valuelen,
                            uint8_t flags, void* user_data) {
    Session* sess = static_cast<Session*>(user_data);
    if (frame->hd.type == NGHTTP2_HEADERS && frame->headers.cat == NGHTTP2_HCAT_REQUEST) {
        auto& stream_data = sess->streams_data_[frame->hd.stream_id];
        auto header_name = std::string(reinterpret_cast<const char*>(name), namelen);
        auto header_value = std::string(reinterpret_cast<const char*>(value), valuelen);
        if (header_name == ":method")
            stream_data.method = header_value;
        else if (header_name == ":path")
            stream_data.path = header_value;
        else if (header_name == ":authority")
            stream_data.authority = header_value;
        else if (header_name.empty() || header_name[0] != ':')
            stream_data.headers.emplace_back(std::move(header_name), std::move(header_value));
    }

    return 0;
}

int Session::on_data_chunk_recv_cb(nghttp2_session* session, uint8_t flags,
                                    int32_t stream_id, const uint8_t* data,
                                    size_t len, void* user_data) {
    Session* sess = static_cast<Session*>(user_data);
    auto it = sess->streams_data_.find(stream_id);
    if (it != sess->streams_data_.end()) {
        it->second.body.append(reinterpret_cast<const char*>(data), len);
    }
    return 0;
}

int Session::on_stream_close_cb(nghttp2_session* session, int32_t stream_id,
                                uint32_t error_code, void* user_data) {
    Session* sess = static_cast<Session*>(user_data);
    auto it = sess->streams_data_.find(stream_id);
    if (it != sess->streams_data_.end()) {
        auto sink = std::move(it->second.sink);
        sess->streams_data_.erase(it);
        if (sink) {
            sink->on_stream_closed();
        }
    }
    LOG_DEBUG("Stream " << stream_id << " closed (error code " << error_code << ")");
    return 0;
}

ssize_t Session::data_source_read_cb(nghttp2_session* session, int32_t stream_id,
                                     uint8_t* buf, size_t length, uint32_t* data_flags,
                                     nghttp2_data_source* source, void* user_data) {
    auto* sink = static_cast<Http2ResponseSink*>(source->ptr);
    return sink->read_body(buf, length, data_flags);
}

Http2ResponseSink::Http2ResponseSink(std::weak_ptr<Session> p_session, int32_t p_stream_id, bool p_head_only,
                                     boost::asio::any_io_executor p_executor)
    : session_(std::move(p_session)), stream_id_(p_stream_id), head_only_(p_head_only),
      executor_(std::move(p_executor)) {}

void Http2ResponseSink::set_abort_handler(std::function<void()> p_handler) {
    abort_handler_ = std::move(p_handler);
}

void Http2ResponseSink::send(const HttpResponse& p_response) {
    if (head_sent_ || closed_) {
        return;
    }

    HeaderList headers = p_response.headers;
    int status = p_response.status_code;
    if (status != 204 && status != 304) {
        set_header(headers, "content-length", std::to_string(p_response.body.size()));
    }
    LOG_INFO("Responded " << status << " on stream " << stream_id_);

    send_head(status, p_response.reason, headers);
    if (has_body_ && !p_response.body.empty()) {
        chunks_.push_back({p_response.body, nullptr});
    }
    finish();
}

void Http2ResponseSink::send_head(int p_status, const std::string& /*p_reason*/, const HeaderList& p_headers) {
    if (head_sent_ || closed_) {
        return;
    }
    head_sent_ = true;
    has_body_ = !head_only_ && p_status != 204 && p_status != 304 && p_status >= 200;
    if (!has_body_) {
        eof_sent_ = true;
    }

    if (auto session = session_.lock()) {
        session->submit_response(stream_id_, p_status, p_headers, has_body_ ? this : nullptr);
    }
}

void Http2ResponseSink::send_chunk(std::string p_chunk, WriteCallback p_on_written) {
    if (closed_) {
        post_callback(std::move(p_on_written), false);
        return;
    }
    if (!has_body_) {
        post_callback(std::move(p_on_written), true);
        return;
    }

    chunks_.push_back({std::move(p_chunk), std::move(p_on_written)});
    if (deferred_) {
        deferred_ = false;
        if (auto session = session_.lock()) {
            session->resume_stream(stream_id_);
        }
    }
}

void Http2ResponseSink::finish() {
    if (finished_ || closed_) {
        return;
    }
    finished_ = true;
    abort_handler_ = nullptr;
    if (has_body_ && deferred_) {
        deferred_ = false;
        if (auto session = session_.lock()) {
            session->resume_stream(stream_id_);
        }
    }
}

void Http2ResponseSink::abort() {
    if (closed_ || eof_sent_) {
        return;
    }
    LOG_WARN("Resetting stream " << stream_id_);
    closed_ = true;
    abort_handler_ = nullptr;
    fail_pending();
    if (auto session = session_.lock()) {
        session->reset_stream(stream_id_);
    }
}

ssize_t Http2ResponseSink::read_body(uint8_t* p_buf, size_t p_length, uint32_t* p_data_flags) {
    if (chunks_.empty()) {
        if (finished_) {
            *p_data_flags |= NGHTTP2_DATA_FLAG_EOF;
            eof_sent_ = true;
            return 0;
        }
        deferred_ = true;
        return NGHTTP2_ERR_DEFERRED;
    }

    auto& front = chunks_.front();
    size_t len = std::min(p_length, front.data.size() - offset_);
    std::memcpy(p_buf, front.data.data() + offset_, len);
    offset_ += len;

    if (offset_ == front.data.size()) {
        post_callback(std::move(front.on_written), true);
        chunks_.pop_front();
        offset_ = 0;
    }
    if (chunks_.empty() && finished_) {
        *p_data_flags |= NGHTTP2_DATA_FLAG_EOF;
        eof_sent_ = true;
    }
    return static_cast<ssize_t>(len);
}

void Http2ResponseSink::on_stream_closed() {
    if (closed_) {
        return;
    }
    closed_ = true;
    if (eof_sent_) {
        return;
    }

    LOG_DEBUG("Stream " << stream_id_ << " closed before the response completed");
    fail_pending();
    if (auto handler = std::move(abort_handler_)) {
        abort_handler_ = nullptr;
        handler();
    }
}

void Http2ResponseSink::fail_pending() {
    for (auto& pending : chunks_) {
        post_callback(std::move(pending.on_written), false);
    }
    chunks_.clear();
    offset_ = 0;
}

void Http2ResponseSink::post_callback(WriteCallback p_cb, bool p_ok) {
    if (!p_cb) {
        return;
    }
    boost::asio::post(executor_, [cb = std::move(p_cb), p_ok]() { cb(p_ok); });
}
