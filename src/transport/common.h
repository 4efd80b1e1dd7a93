#pragma once

#include <nlohmann/json.hpp>
#include <nghttp2/nghttp2.h>
#include <boost/asio/any_io_executor.hpp>
#include <algorithm>
#include <cctype>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
using json = nlohmann::json;

// Header names keep the case they arrived with; lookups are case-insensitive.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

inline bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

inline std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline const std::string* find_header(const HeaderList& headers, std::string_view name) {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return &value;
        }
    }
    return nullptr;
}

inline bool has_header(const HeaderList& headers, std::string_view name) {
    return find_header(headers, name) != nullptr;
}

// Replaces every existing header with the same name.
inline void set_header(HeaderList& headers, std::string_view name, std::string value) {
    headers.erase(std::remove_if(headers.begin(), headers.end(),
                                 [name](const auto& h) { return iequals(h.first, name); }),
                  headers.end());
    headers.emplace_back(std::string(name), std::move(value));
}

inline void remove_header(HeaderList& headers, std::string_view name) {
    headers.erase(std::remove_if(headers.begin(), headers.end(),
                                 [name](const auto& h) { return iequals(h.first, name); }),
                  headers.end());
}

struct HttpRequest {
    std::string method;
    std::string target; // origin-form: path plus optional query
    HeaderList headers;

    std::optional<std::string> header(std::string_view name) const {
        if (const auto* value = find_header(headers, name)) {
            return *value;
        }
        return std::nullopt;
    }

    std::string_view query() const {
        auto pos = target.find('?');
        return pos == std::string::npos ? std::string_view() : std::string_view(target).substr(pos + 1);
    }
};

struct HttpResponse {
    int status_code = 200;
    std::string reason;
    HeaderList headers;
    std::string body;

    HttpResponse() = default;
    HttpResponse(int status, const std::string& response_body, const std::string& type = "application/json")
        : status_code(status), body(response_body) {
        if (!type.empty()) {
            headers.emplace_back("Content-Type", type);
        }
    }
};

// Downstream half of one request. Implemented by each listener; all calls are
// made on the executor returned by get_executor().
class ResponseSink {
    public:
        using WriteCallback = std::function<void(bool ok)>;

        virtual ~ResponseSink() = default;

        // Complete response with an in-memory body.
        virtual void send(const HttpResponse& p_response) = 0;

        // Streamed response: send_head, any number of send_chunk, then finish.
        virtual void send_head(int p_status, const std::string& p_reason, const HeaderList& p_headers) = 0;
        // p_on_written(false) means the client is gone and no more data will be accepted.
        virtual void send_chunk(std::string p_chunk, WriteCallback p_on_written) = 0;
        virtual void finish() = 0;

        // Ends a streamed response that cannot be completed.
        virtual void abort() = 0;

        // Called at most once, when the client goes away before the response completes.
        virtual void set_abort_handler(std::function<void()> p_handler) = 0;

        virtual bool head_sent() const = 0;
        virtual boost::asio::any_io_executor get_executor() = 0;
};

using ResponseSinkPtr = std::shared_ptr<ResponseSink>;
using RequestCB = std::function<void(const HttpRequest& p_request, ResponseSinkPtr p_sink)>;

template <size_t N>
nghttp2_nv make_nv_ls(const char (&name)[N], const std::string& value) {
    return {(uint8_t*)name, (uint8_t*)value.c_str(), (uint16_t)(N - 1),
            (uint16_t)value.size(), NGHTTP2_NV_FLAG_NONE};
}

inline nghttp2_nv make_nv(const std::string& name, const std::string& value) {
    return {(uint8_t*)name.c_str(), (uint8_t*)value.c_str(), name.size(),
            value.size(), NGHTTP2_NV_FLAG_NONE};
}
