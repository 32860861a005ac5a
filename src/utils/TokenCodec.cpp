#include "utils/TokenCodec.hpp"
#include "utils/Hex.hpp"
#include "domain/DomainError.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>
#include <iostream>

namespace catalog::utils {

namespace {

constexpr char kBase32Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

} // namespace

domain::IssuedToken TokenCodec::issue(int64_t userId, std::chrono::seconds ttl, domain::TokenScope scope) {
    std::array<unsigned char, kEntropyBytes> random{};
    if (RAND_bytes(random.data(), static_cast<int>(random.size())) != 1) {
        std::cerr << "[TokenCodec] RAND_bytes failed" << std::endl;
        throw domain::DomainError(domain::ErrorKind::GENERATION, "entropy source unavailable");
    }

    domain::IssuedToken issued;
    issued.plaintext = base32Encode(random.data(), random.size());
    issued.token.hash = hash(issued.plaintext);
    issued.token.userId = userId;
    issued.token.expiry = std::chrono::system_clock::now() + ttl;
    issued.token.scope = scope;
    return issued;
}

std::string TokenCodec::hash(const std::string& plaintext) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;

    if (EVP_Digest(plaintext.data(), plaintext.size(), digest, &digestLen, EVP_sha256(), nullptr) != 1) {
        throw domain::DomainError(domain::ErrorKind::GENERATION, "SHA-256 digest failed");
    }
    return toHex(digest, digestLen);
}

std::string TokenCodec::base32Encode(const unsigned char* data, std::size_t len) {
    std::string out;
    out.reserve((len * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;
    for (std::size_t i = 0; i < len; ++i) {
        buffer = (buffer << 8) | data[i];
        bits += 8;
        while (bits >= 5) {
            out.push_back(kBase32Alphabet[(buffer >> (bits - 5)) & 0x1F]);
            bits -= 5;
        }
    }
    if (bits > 0) {
        out.push_back(kBase32Alphabet[(buffer << (5 - bits)) & 0x1F]);
    }
    return out;
}

} // namespace catalog::utils
