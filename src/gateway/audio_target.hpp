#pragma once

#include "transport/url.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class HostMatch {
    Subdomain, // the host is the pattern or ends with "." + pattern
    Contains   // the pattern occurs anywhere in the host
};

// One entry of the audio host allow-list.
struct HostRule {
    HostMatch match = HostMatch::Subdomain;
    std::string pattern;
    bool force_http = false; // origin does not serve https reliably
    std::string referer;     // sent upstream when non-empty

    bool matches(std::string_view host) const;
};

std::vector<HostRule> default_audio_hosts();

const char* host_match_name(HostMatch match);
std::optional<HostMatch> parse_host_match(std::string_view text);

enum class RejectReason {
    MalformedUrl,
    SchemeNotAllowed,
    HostNotAllowed
};

const char* reject_reason_name(RejectReason reason);

struct ValidatedTarget {
    Url url;             // possibly rewritten to http
    const HostRule* rule; // points into the validator's allow-list
};

class AudioTargetValidator {
public:
    explicit AudioTargetValidator(std::vector<HostRule> rules);

    // Parses and authorizes a client-supplied audio URL. On failure the
    // reason is stored in p_reason when given.
    std::optional<ValidatedTarget> validate(std::string_view raw_url, RejectReason* p_reason = nullptr) const;

    // First rule admitting the host, or nullptr.
    const HostRule* find_rule(std::string_view host) const;

    const std::vector<HostRule>& rules() const { return rules_; }

private:
    std::vector<HostRule> rules_;
};
