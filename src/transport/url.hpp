#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Absolute http-style URL. Scheme and host are stored lowercase, the fragment
// is dropped.
struct Url {
    std::string scheme;
    std::string userinfo;
    std::string host;     // IPv6 literals keep their brackets
    std::string port;     // empty when not given
    std::string path = "/";
    std::string query;    // without the leading '?'

    static std::optional<Url> parse(std::string_view text);

    // RFC 3986 section 5.2 reference resolution.
    std::optional<Url> resolve(std::string_view reference) const;

    uint16_t effective_port() const;
    bool is_default_port() const;
    std::string authority() const;      // host[:port], no userinfo
    std::string request_target() const; // path[?query], escaped
    std::string str() const;
};

QueryParams parse_query(std::string_view query);
std::optional<std::string> query_param(const QueryParams& params, std::string_view name);

std::string form_encode(const QueryParams& params);
std::string percent_decode(std::string_view text, bool plus_as_space);
