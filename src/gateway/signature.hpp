#pragma once

#include <string>

// HMAC-SHA1 over server + type + id, lowercase hex. The upstream metadata API
// checks this value for url, lrc and pic requests.
class SignatureGenerator {
public:
    explicit SignatureGenerator(std::string secret);

    std::string sign(const std::string& server, const std::string& type, const std::string& id) const;

private:
    std::string secret_;
};

std::string to_hex_lower(const unsigned char* data, size_t len);
