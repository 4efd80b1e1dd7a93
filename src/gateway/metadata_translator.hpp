#pragma once

#include "header_filter.hpp"
#include "signature.hpp"
#include "transport/http_client.hpp"
#include "transport/url.hpp"

#include <optional>
#include <string>
#include <string_view>

struct GatewayConfig;

// Public "types" value to the upstream "type" value. Unknown values map to nothing.
std::optional<std::string> upstream_type(std::string_view types);

// The upstream checks a signature for every type except search.
bool requires_signature(std::string_view type);

// Maps the Meting-style public query (types, name, id, source, auth) onto the
// upstream metadata API (server, type, id, auth) and relays its answer.
class MetadataTranslator {
public:
    MetadataTranslator(const GatewayConfig& config, UpstreamClient& client);

    // Fully-formed upstream URL for the given public query parameters.
    Url translate(const QueryParams& params) const;

    void handle(const HttpRequest& request, const QueryParams& params, ResponseSinkPtr sink) const;

private:
    Url base_url_;
    std::string default_source_;
    std::string fallback_user_agent_;
    int max_redirects_;
    SignatureGenerator signer_;
    HeaderFilter filter_;
    UpstreamClient& client_;
};
