#include "header_filter.hpp"

#include <algorithm>

const std::vector<std::string> SAFE_RESPONSE_HEADERS = {
    "content-type",
    "cache-control",
    "accept-ranges",
    "content-length",
    "content-range",
    "etag",
    "last-modified",
    "expires",
};

HeaderFilter::HeaderFilter(std::vector<std::string> allowed, std::string default_cache_control)
    : allowed_(std::move(allowed)), default_cache_control_(std::move(default_cache_control)) {
    for (auto& name : allowed_) {
        name = to_lower(name);
    }
}

bool HeaderFilter::is_allowed(std::string_view name) const {
    return std::any_of(allowed_.begin(), allowed_.end(),
                       [name](const std::string& allowed) { return iequals(allowed, name); });
}

HeaderList HeaderFilter::apply(const HeaderList& source) const {
    HeaderList out;
    for (const auto& [name, value] : source) {
        if (is_allowed(name)) {
            set_header(out, name, value);
        }
    }
    if (!has_header(out, "Cache-Control")) {
        out.emplace_back("Cache-Control", default_cache_control_);
    }
    set_header(out, "Access-Control-Allow-Origin", "*");
    return out;
}
