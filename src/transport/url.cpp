#include "url.hpp"

#include <cctype>

namespace {

bool is_scheme_char(unsigned char c) {
    return std::isalnum(c) || c == '+' || c == '-' || c == '.';
}

bool is_host_char(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_';
}

bool is_ipv6_char(unsigned char c) {
    return std::isxdigit(c) || c == ':' || c == '.';
}

bool has_control_chars(std::string_view text) {
    for (unsigned char c : text) {
        if (c < 0x20 || c == 0x7f) {
            return true;
        }
    }
    return false;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && static_cast<unsigned char>(text.front()) <= 0x20) text.remove_prefix(1);
    while (!text.empty() && static_cast<unsigned char>(text.back()) <= 0x20) text.remove_suffix(1);
    return text;
}

// Length of a leading "scheme:" or 0 when the text does not start with one.
size_t scheme_length(std::string_view text) {
    if (text.empty() || !std::isalpha(static_cast<unsigned char>(text[0]))) {
        return 0;
    }
    for (size_t i = 1; i < text.size(); ++i) {
        unsigned char c = text[i];
        if (c == ':') {
            return i;
        }
        if (!is_scheme_char(c)) {
            return 0;
        }
    }
    return 0;
}

void split_path_query(std::string_view text, std::string& path, std::string& query) {
    auto hash = text.find('#');
    if (hash != std::string_view::npos) {
        text = text.substr(0, hash);
    }
    auto question = text.find('?');
    if (question == std::string_view::npos) {
        path.assign(text);
        query.clear();
    } else {
        path.assign(text.substr(0, question));
        query.assign(text.substr(question + 1));
    }
}

std::string remove_dot_segments(std::string_view path) {
    std::vector<std::string> segments;
    size_t start = (!path.empty() && path[0] == '/') ? 1 : 0;
    bool trailing_slash = false;

    while (true) {
        size_t slash = path.find('/', start);
        bool last = slash == std::string_view::npos;
        std::string_view segment = path.substr(start, last ? std::string_view::npos : slash - start);

        if (segment == "..") {
            if (!segments.empty()) {
                segments.pop_back();
            }
            trailing_slash = last;
        } else if (segment == ".") {
            trailing_slash = last;
        } else {
            segments.emplace_back(segment);
            trailing_slash = false;
        }

        if (last) {
            break;
        }
        start = slash + 1;
    }

    std::string out;
    for (const auto& segment : segments) {
        out += '/';
        out += segment;
    }
    if (trailing_slash || out.empty()) {
        out += '/';
    }
    return out;
}

std::string escape_target(std::string_view text) {
    static const char* HEX = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        bool unsafe = c <= 0x20 || c >= 0x7f || c == '"' || c == '<' || c == '>' ||
                      c == '`' || c == '{' || c == '}';
        if (unsafe) {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0xF];
        } else {
            out += static_cast<char>(c);
        }
    }
    return out;
}

int hex_value(unsigned char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::optional<Url> Url::parse(std::string_view text) {
    text = trim(text);
    if (has_control_chars(text)) {
        return std::nullopt;
    }

    size_t colon = scheme_length(text);
    if (colon == 0) {
        return std::nullopt;
    }

    Url url;
    for (char c : text.substr(0, colon)) {
        url.scheme += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    std::string_view rest = text.substr(colon + 1);
    if (rest.substr(0, 2) != "//") {
        return std::nullopt;
    }
    rest.remove_prefix(2);

    auto authority_end = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, authority_end);
    rest = authority_end == std::string_view::npos ? std::string_view() : rest.substr(authority_end);

    // The last '@' ends the userinfo: "http://a.com@b.net/" names b.net.
    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        url.userinfo.assign(authority.substr(0, at));
        authority.remove_prefix(at + 1);
    }

    std::string_view host;
    std::string_view port;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        host = authority.substr(0, close + 1);
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return std::nullopt;
            }
            port = after.substr(1);
        }
        for (unsigned char c : host.substr(1, host.size() - 2)) {
            if (!is_ipv6_char(c)) {
                return std::nullopt;
            }
        }
        if (host.size() <= 2) {
            return std::nullopt;
        }
    } else {
        auto port_colon = authority.find(':');
        host = authority.substr(0, port_colon);
        if (port_colon != std::string_view::npos) {
            port = authority.substr(port_colon + 1);
        }
        if (host.empty()) {
            return std::nullopt;
        }
        for (unsigned char c : host) {
            if (!is_host_char(c)) {
                return std::nullopt;
            }
        }
    }

    if (!port.empty()) {
        if (port.size() > 5) {
            return std::nullopt;
        }
        for (unsigned char c : port) {
            if (!std::isdigit(c)) {
                return std::nullopt;
            }
        }
        if (std::stoul(std::string(port)) > 65535) {
            return std::nullopt;
        }
    }

    for (char c : host) {
        url.host += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    url.port.assign(port);

    split_path_query(rest, url.path, url.query);
    if (url.path.empty()) {
        url.path = "/";
    }
    return url;
}

std::optional<Url> Url::resolve(std::string_view reference) const {
    reference = trim(reference);

    if (scheme_length(reference) != 0) {
        return Url::parse(reference);
    }
    if (reference.substr(0, 2) == "//") {
        return Url::parse(scheme + ":" + std::string(reference));
    }
    if (has_control_chars(reference)) {
        return std::nullopt;
    }

    Url target = *this;
    std::string ref_path;
    std::string ref_query;
    bool has_query = reference.find('?') != std::string_view::npos &&
                     reference.find('?') < reference.find('#');
    split_path_query(reference, ref_path, ref_query);

    if (ref_path.empty()) {
        if (has_query) {
            target.query = ref_query;
        }
        return target;
    }

    if (ref_path.front() == '/') {
        target.path = remove_dot_segments(ref_path);
    } else {
        auto last_slash = path.rfind('/');
        std::string merged = last_slash == std::string::npos ? "/" : path.substr(0, last_slash + 1);
        merged += ref_path;
        target.path = remove_dot_segments(merged);
    }
    target.query = ref_query;
    return target;
}

uint16_t Url::effective_port() const {
    if (!port.empty()) {
        return static_cast<uint16_t>(std::stoul(port));
    }
    return scheme == "https" ? 443 : 80;
}

bool Url::is_default_port() const {
    return port.empty() ||
           (scheme == "http" && port == "80") ||
           (scheme == "https" && port == "443");
}

std::string Url::authority() const {
    return is_default_port() ? host : host + ":" + port;
}

std::string Url::request_target() const {
    std::string target = escape_target(path);
    if (!query.empty()) {
        target += '?';
        target += escape_target(query);
    }
    return target;
}

std::string Url::str() const {
    std::string out = scheme + "://";
    if (!userinfo.empty()) {
        out += userinfo + "@";
    }
    out += authority();
    out += request_target();
    return out;
}

QueryParams parse_query(std::string_view query) {
    QueryParams params;
    while (!query.empty()) {
        auto amp = query.find('&');
        std::string_view pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view() : query.substr(amp + 1);
        if (pair.empty()) {
            continue;
        }
        auto eq = pair.find('=');
        if (eq == std::string_view::npos) {
            params.emplace_back(percent_decode(pair, true), std::string());
        } else {
            params.emplace_back(percent_decode(pair.substr(0, eq), true),
                                percent_decode(pair.substr(eq + 1), true));
        }
    }
    return params;
}

std::optional<std::string> query_param(const QueryParams& params, std::string_view name) {
    for (const auto& [key, value] : params) {
        if (key == name) {
            return value;
        }
    }
    return std::nullopt;
}

std::string form_encode(const QueryParams& params) {
    static const char* HEX = "0123456789ABCDEF";
    auto encode = [](std::string& out, std::string_view text) {
        for (unsigned char c : text) {
            if (std::isalnum(c) || c == '*' || c == '-' || c == '.' || c == '_') {
                out += static_cast<char>(c);
            } else if (c == ' ') {
                out += '+';
            } else {
                out += '%';
                out += HEX[c >> 4];
                out += HEX[c & 0xF];
            }
        }
    };

    std::string out;
    for (size_t i = 0; i < params.size(); ++i) {
        if (i) out += '&';
        encode(out, params[i].first);
        out += '=';
        encode(out, params[i].second);
    }
    return out;
}

std::string percent_decode(std::string_view text, bool plus_as_space) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = text[i];
        if (c == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        if (c == '+' && plus_as_space) {
            out += ' ';
        } else {
            out += static_cast<char>(c);
        }
    }
    return out;
}
