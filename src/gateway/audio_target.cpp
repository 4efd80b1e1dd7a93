#include "audio_target.hpp"

#include "transport/common.h"

bool HostRule::matches(std::string_view host) const {
    if (host.empty() || pattern.empty()) {
        return false;
    }

    switch (match) {
        case HostMatch::Subdomain:
            if (host == pattern) {
                return true;
            }
            return host.size() > pattern.size() &&
                   host.substr(host.size() - pattern.size()) == pattern &&
                   host[host.size() - pattern.size() - 1] == '.';

        case HostMatch::Contains:
            return host.find(pattern) != std::string_view::npos;
    }
    return false;
}

std::vector<HostRule> default_audio_hosts() {
    return {
        {HostMatch::Subdomain, "kuwo.cn", true, "https://www.kuwo.cn/"},
        {HostMatch::Contains, "music.126.net", false, ""},
        {HostMatch::Contains, "qq.com", false, ""},
    };
}

const char* host_match_name(HostMatch match) {
    switch (match) {
        case HostMatch::Subdomain: return "subdomain";
        case HostMatch::Contains: return "contains";
    }
    return "unknown";
}

std::optional<HostMatch> parse_host_match(std::string_view text) {
    if (text == "subdomain") return HostMatch::Subdomain;
    if (text == "contains") return HostMatch::Contains;
    return std::nullopt;
}

const char* reject_reason_name(RejectReason reason) {
    switch (reason) {
        case RejectReason::MalformedUrl: return "malformed url";
        case RejectReason::SchemeNotAllowed: return "scheme not allowed";
        case RejectReason::HostNotAllowed: return "host not allowed";
    }
    return "unknown";
}

AudioTargetValidator::AudioTargetValidator(std::vector<HostRule> rules)
    : rules_(std::move(rules)) {
    for (auto& rule : rules_) {
        rule.pattern = to_lower(rule.pattern);
    }
}

const HostRule* AudioTargetValidator::find_rule(std::string_view host) const {
    for (const auto& rule : rules_) {
        if (rule.matches(host)) {
            return &rule;
        }
    }
    return nullptr;
}

std::optional<ValidatedTarget> AudioTargetValidator::validate(std::string_view raw_url, RejectReason* p_reason) const {
    auto reject = [p_reason](RejectReason reason) -> std::optional<ValidatedTarget> {
        if (p_reason) {
            *p_reason = reason;
        }
        return std::nullopt;
    };

    auto url = Url::parse(raw_url);
    if (!url) {
        return reject(RejectReason::MalformedUrl);
    }
    if (url->scheme != "http" && url->scheme != "https") {
        return reject(RejectReason::SchemeNotAllowed);
    }

    const HostRule* rule = find_rule(url->host);
    if (!rule) {
        return reject(RejectReason::HostNotAllowed);
    }

    if (rule->force_http && url->scheme != "http") {
        url->scheme = "http";
        if (url->port == "443") {
            url->port.clear();
        }
    }
    return ValidatedTarget{std::move(*url), rule};
}
