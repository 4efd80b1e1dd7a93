#include "signature.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <stdexcept>

SignatureGenerator::SignatureGenerator(std::string secret)
    : secret_(std::move(secret)) {}

std::string SignatureGenerator::sign(const std::string& server, const std::string& type, const std::string& id) const {
    const std::string message = server + type + id;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (!HMAC(EVP_sha1(),
              secret_.data(), static_cast<int>(secret_.size()),
              reinterpret_cast<const unsigned char*>(message.data()), message.size(),
              digest, &digest_len)) {
        throw std::runtime_error("HMAC-SHA1 computation failed");
    }
    return to_hex_lower(digest, digest_len);
}

std::string to_hex_lower(const unsigned char* data, size_t len) {
    static const char* HEX = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = HEX[(data[i] >> 4) & 0xF];
        out[2 * i + 1] = HEX[data[i] & 0xF];
    }
    return out;
}
