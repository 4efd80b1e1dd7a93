#pragma once

#include "transport/common.h"

#include <string>
#include <vector>

// Response headers from the upstream that may reach the browser.
extern const std::vector<std::string> SAFE_RESPONSE_HEADERS;

// Copies only allow-listed response headers across the trust boundary.
// Everything else (cookies, auth, hop-by-hop headers) is dropped.
class HeaderFilter {
public:
    HeaderFilter(std::vector<std::string> allowed, std::string default_cache_control);

    // Always adds Access-Control-Allow-Origin: * and falls back to the
    // default Cache-Control when the source has none.
    HeaderList apply(const HeaderList& source) const;

    bool is_allowed(std::string_view name) const;
    const std::string& default_cache_control() const { return default_cache_control_; }

private:
    std::vector<std::string> allowed_;
    std::string default_cache_control_;
};
