#include "metadata_translator.hpp"
#include "response_relay.hpp"
#include "core/config.h"
#include "utils/logger.h"

namespace {

// Treats an empty parameter the same as a missing one.
std::optional<std::string> non_empty_param(const QueryParams& params, std::string_view name) {
    auto value = query_param(params, name);
    if (value && value->empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::optional<std::string> upstream_type(std::string_view types) {
    if (types == "search") return std::string("search");
    if (types == "url") return std::string("url");
    if (types == "lyric") return std::string("lrc");
    if (types == "pic") return std::string("pic");
    return std::nullopt;
}

bool requires_signature(std::string_view type) {
    return type == "url" || type == "lrc" || type == "pic";
}

MetadataTranslator::MetadataTranslator(const GatewayConfig& config, UpstreamClient& client)
    : base_url_(*Url::parse(config.api_base_url)),
      default_source_(config.default_source),
      fallback_user_agent_(config.fallback_user_agent),
      max_redirects_(config.max_redirects),
      signer_(config.auth_secret),
      filter_(SAFE_RESPONSE_HEADERS, config.metadata_cache_control),
      client_(client) {}

Url MetadataTranslator::translate(const QueryParams& params) const {
    Url url = base_url_;

    auto type = upstream_type(query_param(params, "types").value_or(""));
    if (!type) {
        return url;
    }

    const std::string source = non_empty_param(params, "source").value_or(default_source_);
    const std::string id = *type == "search"
        ? query_param(params, "name").value_or("")
        : query_param(params, "id").value_or("");

    QueryParams upstream = {
        {"server", source},
        {"type", *type},
        {"id", id},
    };

    if (auto auth = non_empty_param(params, "auth")) {
        upstream.emplace_back("auth", *auth);
    } else if (requires_signature(*type)) {
        upstream.emplace_back("auth", signer_.sign(source, *type, id));
    }

    std::string encoded = form_encode(upstream);
    url.query = url.query.empty() ? encoded : url.query + "&" + encoded;
    return url;
}

void MetadataTranslator::handle(const HttpRequest& request, const QueryParams& params, ResponseSinkPtr sink) const {
    UpstreamRequest upstream;
    upstream.method = "GET";
    upstream.url = translate(params);
    upstream.max_redirects = max_redirects_;
    upstream.headers = {
        {"User-Agent", request.header("User-Agent").value_or(fallback_user_agent_)},
        {"Accept", "application/json"},
    };

    LOG_DEBUG("Metadata request to " << upstream.url.authority() << upstream.url.path
              << " type=" << printable(query_param(params, "types").value_or("<none>")));

    auto relay = std::make_shared<ResponseRelay>(std::move(sink), filter_, [](HeaderList& headers) {
        if (!has_header(headers, "Content-Type")) {
            headers.emplace_back("Content-Type", "application/json; charset=utf-8");
        }
    });
    relay->start(client_, std::move(upstream));
}
