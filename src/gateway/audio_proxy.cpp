#include "audio_proxy.hpp"
#include "response_relay.hpp"
#include "core/config.h"
#include "utils/logger.h"

AudioProxy::AudioProxy(const GatewayConfig& config, const AudioTargetValidator& validator, UpstreamClient& client)
    : validator_(validator),
      fallback_user_agent_(config.fallback_user_agent),
      max_redirects_(config.max_redirects),
      filter_(SAFE_RESPONSE_HEADERS, config.audio_cache_control),
      client_(client) {}

UpstreamRequest AudioProxy::build_request(const HttpRequest& request, const ValidatedTarget& target) const {
    UpstreamRequest upstream;
    upstream.method = request.method;
    upstream.url = target.url;
    upstream.max_redirects = max_redirects_;
    upstream.headers.emplace_back("User-Agent", request.header("User-Agent").value_or(fallback_user_agent_));

    if (target.rule && !target.rule->referer.empty()) {
        upstream.headers.emplace_back("Referer", target.rule->referer);
    }
    if (auto range = request.header("Range")) {
        upstream.headers.emplace_back("Range", *range);
    }

    // Every hop is validated like a client target, so it gets the same
    // scheme rewrite and Referer as a direct request to that host.
    const AudioTargetValidator* validator = &validator_;
    upstream.redirect_filter = [validator](const Url& next, HeaderList& headers) -> std::optional<Url> {
        RejectReason reason = RejectReason::MalformedUrl;
        auto hop = validator->validate(next.str(), &reason);
        if (!hop) {
            LOG_WARN("Refusing audio redirect (" << reject_reason_name(reason) << ")");
            return std::nullopt;
        }
        if (hop->rule && !hop->rule->referer.empty()) {
            set_header(headers, "Referer", hop->rule->referer);
        } else {
            remove_header(headers, "Referer");
        }
        return hop->url;
    };
    return upstream;
}

void AudioProxy::handle(const HttpRequest& request, const ValidatedTarget& target, ResponseSinkPtr sink) const {
    LOG_DEBUG("Audio request to " << target.url.authority() << target.url.path
              << (request.header("Range") ? " (ranged)" : ""));

    auto relay = std::make_shared<ResponseRelay>(std::move(sink), filter_, [](HeaderList& headers) {
        set_header(headers, "Access-Control-Allow-Methods", "GET,HEAD,OPTIONS");
        set_header(headers, "Access-Control-Expose-Headers", "Content-Range, Content-Length, Accept-Ranges");
    });
    relay->start(client_, build_request(request, target));
}
