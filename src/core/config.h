#pragma once

#include "../gateway/audio_target.hpp"
#include "../utils/logger.h"

#include <nlohmann/json.hpp>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Process-wide settings, read once at start-up and immutable afterwards.
struct GatewayConfig {
    using EnvLookup = std::function<const char*(const char*)>;

    // listeners
    int port = 8080;
    int http1_port = 9080;
    int threads = 4;
    bool use_ssl = false;
    std::string cert_file = "certs/server.crt";
    std::string key_file = "certs/server.key";
    LogLevel log_level = LogLevel::Info;

    // metadata upstream
    std::string api_base_url = "https://api.i-meto.com/meting/api";
    std::string auth_secret = "meting-secret";
    std::string default_source = "netease";
    std::string metadata_cache_control = "no-store";

    // audio upstream
    std::vector<HostRule> audio_hosts = default_audio_hosts();
    std::string audio_cache_control = "no-store";

    // shared upstream behaviour
    std::string fallback_user_agent = "Mozilla/5.0";
    int max_redirects = 20;
    std::string upstream_ca_file;

    // Defaults, then the JSON file named by GATEWAY_CONFIG, then the environment.
    static GatewayConfig load(const EnvLookup& lookup);

    void apply_json(const nlohmann::json& doc);
    void apply_file(const std::string& path);
    void apply_env(const EnvLookup& lookup);
    void validate() const;
};
