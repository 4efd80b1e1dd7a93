#pragma once

#include "audio_proxy.hpp"
#include "audio_target.hpp"
#include "metadata_translator.hpp"
#include "transport/common.h"

struct GatewayConfig;

enum class Route {
    Preflight,
    MethodNotAllowed,
    Audio,
    Metadata
};

const char* route_name(Route route);

// Entry point for every request arriving on either listener.
class RequestRouter {
    public:
        RequestRouter(const GatewayConfig& p_config, UpstreamClient& p_client);

        static Route classify(const HttpRequest& p_request, const QueryParams& p_params);

        void handle_request(const HttpRequest& p_request, ResponseSinkPtr p_sink) const;

        const AudioTargetValidator& validator() const { return validator_; }
        const MetadataTranslator& metadata() const { return metadata_; }

    private:
        void dispatch(const HttpRequest& p_request, const ResponseSinkPtr& p_sink) const;

    private:
        AudioTargetValidator validator_;
        AudioProxy audio_proxy_;
        MetadataTranslator metadata_;
};
