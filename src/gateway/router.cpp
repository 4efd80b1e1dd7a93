#include "router.hpp"
#include "responses.hpp"
#include "core/config.h"
#include "utils/logger.h"

const char* route_name(Route route) {
    switch (route) {
        case Route::Preflight: return "preflight";
        case Route::MethodNotAllowed: return "method-not-allowed";
        case Route::Audio: return "audio";
        case Route::Metadata: return "metadata";
    }
    return "unknown";
}

RequestRouter::RequestRouter(const GatewayConfig& p_config, UpstreamClient& p_client)
    : validator_(p_config.audio_hosts),
      audio_proxy_(p_config, validator_, p_client),
      metadata_(p_config, p_client) {}

Route RequestRouter::classify(const HttpRequest& p_request, const QueryParams& p_params) {
    if (p_request.method == "OPTIONS") {
        return Route::Preflight;
    }
    if (p_request.method != "GET" && p_request.method != "HEAD") {
        return Route::MethodNotAllowed;
    }
    auto target = query_param(p_params, "target");
    return (target && !target->empty()) ? Route::Audio : Route::Metadata;
}

void RequestRouter::handle_request(const HttpRequest& p_request, ResponseSinkPtr p_sink) const {
    try
    {
        dispatch(p_request, p_sink);
    }
    catch(const std::exception& e)
    {
        LOG_ERROR("Request " << p_request.method << " failed: " << e.what());
        if (!p_sink->head_sent()) {
            p_sink->send(internal_error_response());
        } else {
            p_sink->abort();
        }
    }
}

void RequestRouter::dispatch(const HttpRequest& p_request, const ResponseSinkPtr& p_sink) const {
    const QueryParams params = parse_query(p_request.query());
    const Route route = classify(p_request, params);

    const auto query_pos = p_request.target.find('?');
    LOG_INFO("Processing " << p_request.method << " "
             << p_request.target.substr(0, query_pos) << " -> " << route_name(route));

    switch (route) {
        case Route::Preflight:
            p_sink->send(preflight_response());
            return;

        case Route::MethodNotAllowed:
            p_sink->send(method_not_allowed_response());
            return;

        case Route::Audio: {
            const std::string raw = *query_param(params, "target");
            RejectReason reason = RejectReason::MalformedUrl;
            auto target = validator_.validate(raw, &reason);
            if (!target) {
                LOG_WARN("Rejected audio target (" << reject_reason_name(reason) << "): " << printable(raw));
                p_sink->send(invalid_target_response());
                return;
            }
            audio_proxy_.handle(p_request, *target, p_sink);
            return;
        }

        case Route::Metadata:
            metadata_.handle(p_request, params, p_sink);
            return;
    }
}
