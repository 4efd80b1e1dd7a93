#include "config.h"
#include "../transport/url.hpp"

#include <fstream>

using json = nlohmann::json;

namespace {

int parse_int(const std::string& name, const std::string& text) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size()) {
            throw ConfigError(name + ": trailing characters in \"" + text + "\"");
        }
        return value;
    } catch (const std::logic_error&) {
        throw ConfigError(name + ": not a number: \"" + text + "\"");
    }
}

template <typename T>
void read_if_present(const json& doc, const char* key, T& out) {
    auto it = doc.find(key);
    if (it == doc.end()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string(key) + ": " + e.what());
    }
}

HostRule parse_host_rule(const json& entry) {
    if (!entry.is_object()) {
        throw ConfigError("audio_hosts: every entry must be an object");
    }

    HostRule rule;
    std::string match = entry.value("match", "subdomain");
    auto kind = parse_host_match(match);
    if (!kind) {
        throw ConfigError("audio_hosts: unknown match kind \"" + match + "\"");
    }
    rule.match = *kind;

    read_if_present(entry, "pattern", rule.pattern);
    read_if_present(entry, "force_http", rule.force_http);
    read_if_present(entry, "referer", rule.referer);
    if (rule.pattern.empty()) {
        throw ConfigError("audio_hosts: pattern must not be empty");
    }
    return rule;
}

} // namespace

GatewayConfig GatewayConfig::load(const EnvLookup& lookup) {
    GatewayConfig config;
    if (const char* path = lookup("GATEWAY_CONFIG")) {
        config.apply_file(path);
    }
    config.apply_env(lookup);
    config.validate();
    return config;
}

void GatewayConfig::apply_json(const json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("configuration root must be a JSON object");
    }

    read_if_present(doc, "port", port);
    read_if_present(doc, "http1_port", http1_port);
    read_if_present(doc, "threads", threads);
    read_if_present(doc, "use_ssl", use_ssl);
    read_if_present(doc, "cert_file", cert_file);
    read_if_present(doc, "key_file", key_file);
    read_if_present(doc, "api_base_url", api_base_url);
    read_if_present(doc, "auth_secret", auth_secret);
    read_if_present(doc, "default_source", default_source);
    read_if_present(doc, "metadata_cache_control", metadata_cache_control);
    read_if_present(doc, "audio_cache_control", audio_cache_control);
    read_if_present(doc, "fallback_user_agent", fallback_user_agent);
    read_if_present(doc, "max_redirects", max_redirects);
    read_if_present(doc, "upstream_ca_file", upstream_ca_file);

    if (auto it = doc.find("log_level"); it != doc.end()) {
        try {
            log_level = Logger::parse_level(it->get<std::string>());
        } catch (const std::exception& e) {
            throw ConfigError(std::string("log_level: ") + e.what());
        }
    }

    if (auto it = doc.find("audio_hosts"); it != doc.end()) {
        if (!it->is_array()) {
            throw ConfigError("audio_hosts must be an array");
        }
        std::vector<HostRule> rules;
        for (const auto& entry : *it) {
            rules.push_back(parse_host_rule(entry));
        }
        audio_hosts = std::move(rules);
    }
}

void GatewayConfig::apply_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open configuration file " + path);
    }

    json doc;
    try {
        in >> doc;
    } catch (const json::parse_error& e) {
        throw ConfigError("invalid JSON in " + path + ": " + e.what());
    }
    apply_json(doc);
}

void GatewayConfig::apply_env(const EnvLookup& lookup) {
    auto env = [&lookup](const char* name) -> const char* {
        const char* value = lookup(name);
        return (value && *value) ? value : nullptr;
    };

    if (const char* v = env("PORT")) port = parse_int("PORT", v);
    if (const char* v = env("HTTP1_PORT")) http1_port = parse_int("HTTP1_PORT", v);
    if (const char* v = env("THREADS")) threads = parse_int("THREADS", v);
    if (const char* v = env("USE_SSL")) use_ssl = std::string(v) == "1";
    if (const char* v = env("CERT_FILE")) cert_file = v;
    if (const char* v = env("KEY_FILE")) key_file = v;
    if (const char* v = env("METING_API_URL")) api_base_url = v;
    if (const char* v = env("METING_AUTH_SECRET")) auth_secret = v;
    if (const char* v = env("METING_DEFAULT_SOURCE")) default_source = v;
    if (const char* v = env("UPSTREAM_CA_FILE")) upstream_ca_file = v;
    if (const char* v = env("LOG_LEVEL")) {
        try {
            log_level = Logger::parse_level(v);
        } catch (const std::invalid_argument& e) {
            throw ConfigError(std::string("LOG_LEVEL: ") + e.what());
        }
    }
}

void GatewayConfig::validate() const {
    auto check_port = [](const char* name, int value) {
        if (value <= 0 || value > 65535) {
            throw ConfigError(std::string(name) + " out of range: " + std::to_string(value));
        }
    };
    check_port("port", port);
    check_port("http1_port", http1_port);

    if (threads < 1) {
        throw ConfigError("threads must be at least 1");
    }
    if (max_redirects < 0) {
        throw ConfigError("max_redirects must not be negative");
    }

    auto base = Url::parse(api_base_url);
    if (!base || (base->scheme != "http" && base->scheme != "https")) {
        throw ConfigError("api_base_url is not an absolute http(s) URL: " + api_base_url);
    }
    if (default_source.empty()) {
        throw ConfigError("default_source must not be empty");
    }
    if (audio_hosts.empty()) {
        throw ConfigError("audio_hosts must not be empty");
    }
}
