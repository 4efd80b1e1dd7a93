#pragma once

#include "audio_target.hpp"
#include "header_filter.hpp"
#include "transport/http_client.hpp"

#include <string>

struct GatewayConfig;

// Streams an allow-listed audio file from its host to the client.
class AudioProxy {
public:
    AudioProxy(const GatewayConfig& config, const AudioTargetValidator& validator, UpstreamClient& client);

    UpstreamRequest build_request(const HttpRequest& request, const ValidatedTarget& target) const;

    void handle(const HttpRequest& request, const ValidatedTarget& target, ResponseSinkPtr sink) const;

private:
    const AudioTargetValidator& validator_;
    std::string fallback_user_agent_;
    int max_redirects_;
    HeaderFilter filter_;
    UpstreamClient& client_;
};
