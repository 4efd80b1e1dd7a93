#pragma once

#include "common.h"
#include "../utils/logger.h"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <nghttp2/nghttp2.h>
#include <array>
#include <deque>
#include <functional>
#include <unordered_map>

class Http2ResponseSink;

class Session : public std::enable_shared_from_this<Session> {
    public:
        explicit Session(boost::asio::ip::tcp::socket p_socket, RequestCB p_request_cb);
        explicit Session(boost::asio::ip::tcp::socket p_socket, boost::asio::ssl::context& ssl_context, RequestCB p_request_cb);
        ~Session();

        void start();
    private:
        friend class Http2ResponseSink;

        // nghttp2 callbacks
        static int on_frame_recv_cb(nghttp2_session* session, const nghttp2_frame* frame,
                                     void* user_data);
        static int on_header_cb(nghttp2_session* session, const nghttp2_frame* frame,
                                 const uint8_t* name, size_t namelen, const uint8_t* value, size_t valuelen,
                                 uint8_t flags, void* user_data);
        static int on_data_chunk_recv_cb(nghttp2_session* session, uint8_t flags,
                                         int32_t stream_id, const uint8_t* data,
                                         size_t len, void* user_data);
        static int on_stream_close_cb(nghttp2_session* session, int32_t stream_id,
                                       uint32_t error_code, void* user_data);
        static ssize_t data_source_read_cb(nghttp2_session* session, int32_t stream_id,
                                           uint8_t* buf, size_t length, uint32_t* data_flags,
                                           nghttp2_data_source* source, void* user_data);

        // Session management
        void setup_nghttp2();
        void read_data();
        void write_data();
        void handle_ssl_handshake();
        void shutdown();
        boost::asio::any_io_executor executor();

        // Request handling
        void dispatch_request(int32_t p_stream_id);

        // Used by Http2ResponseSink
        void submit_response(int32_t p_stream_id, int p_status, const HeaderList& p_headers,
                             Http2ResponseSink* p_body_source);
        void resume_stream(int32_t p_stream_id);
        void reset_stream(int32_t p_stream_id);

        struct StreamData
        {
            std::string method;
            std::string path;
            std::string authority;
            HeaderList headers;
            std::string body;
            bool dispatched = false;
            std::shared_ptr<Http2ResponseSink> sink;
        };

    private:
        nghttp2_session* session_ = nullptr;
        std::unique_ptr<boost::asio::ip::tcp::socket> plain_socket_;
        std::unique_ptr<boost::asio::ssl::stream<boost::asio::ip::tcp::socket>> ssl_socket_;
        RequestCB request_cb_;
        std::array<uint8_t, 8192> read_buffer_;
        std::string write_buffer_;
        std::unordered_map<int32_t, StreamData> streams_data_;
        bool use_ssl_ = false;
        bool writing_ = false;
        bool closed_ = false;
};

// ResponseSink for one HTTP/2 stream. Body chunks wait in a queue until the
// data provider pulls them; an empty queue defers the stream.
class Http2ResponseSink : public ResponseSink, public std::enable_shared_from_this<Http2ResponseSink> {
    public:
        Http2ResponseSink(std::weak_ptr<Session> p_session, int32_t p_stream_id, bool p_head_only,
                          boost::asio::any_io_executor p_executor);

        void send(const HttpResponse& p_response) override;
        void send_head(int p_status, const std::string& p_reason, const HeaderList& p_headers) override;
        void send_chunk(std::string p_chunk, WriteCallback p_on_written) override;
        void finish() override;
        void abort() override;
        void set_abort_handler(std::function<void()> p_handler) override;
        bool head_sent() const override { return head_sent_; }
        boost::asio::any_io_executor get_executor() override { return executor_; }

    private:
        friend class Session;

        struct PendingChunk {
            std::string data;
            WriteCallback on_written;
        };

        ssize_t read_body(uint8_t* p_buf, size_t p_length, uint32_t* p_data_flags);
        void on_stream_closed();
        void fail_pending();
        void post_callback(WriteCallback p_cb, bool p_ok);

        std::weak_ptr<Session> session_;
        int32_t stream_id_;
        bool head_only_;
        boost::asio::any_io_executor executor_;

        bool head_sent_ = false;
        bool has_body_ = false;
        bool finished_ = false;
        bool deferred_ = false;
        bool eof_sent_ = false;
        bool closed_ = false;

        std::deque<PendingChunk> chunks_;
        size_t offset_ = 0;
        std::function<void()> abort_handler_;
};
