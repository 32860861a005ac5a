#include "utils/PasswordHasher.hpp"
#include "utils/Hex.hpp"
#include "domain/DomainError.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <iostream>
#include <sstream>
#include <vector>

namespace catalog::utils {

namespace {

const std::string kPrefix = "$pbkdf2-sha256$";

bool derive(const std::string& plaintext, const unsigned char* salt, int saltLen,
            int iterations, unsigned char* key, int keyLen) {
    return PKCS5_PBKDF2_HMAC(
        plaintext.c_str(), static_cast<int>(plaintext.size()),
        salt, saltLen,
        iterations,
        EVP_sha256(),
        keyLen, key) == 1;
}

} // namespace

std::string PasswordHasher::hash(const std::string& plaintext) {
    unsigned char salt[kSaltLength];
    unsigned char key[kKeyLength];

    if (RAND_bytes(salt, kSaltLength) != 1) {
        std::cerr << "[PasswordHasher] Failed to generate salt" << std::endl;
        throw domain::DomainError(domain::ErrorKind::GENERATION, "entropy source unavailable");
    }

    if (!derive(plaintext, salt, kSaltLength, kIterations, key, kKeyLength)) {
        std::cerr << "[PasswordHasher] PBKDF2 failed" << std::endl;
        throw domain::DomainError(domain::ErrorKind::GENERATION, "password hashing failed");
    }

    std::ostringstream oss;
    oss << kPrefix << kIterations << "$" << toHex(salt, kSaltLength) << "$" << toHex(key, kKeyLength);
    return oss.str();
}

bool PasswordHasher::verify(const std::string& plaintext, const std::string& encoded) {
    if (encoded.compare(0, kPrefix.size(), kPrefix) != 0) {
        return false;
    }

    // $pbkdf2-sha256$iterations$salt$key
    auto pos1 = encoded.find('$', kPrefix.size());
    if (pos1 == std::string::npos) return false;
    auto pos2 = encoded.find('$', pos1 + 1);
    if (pos2 == std::string::npos) return false;

    int iterations = 0;
    try {
        iterations = std::stoi(encoded.substr(kPrefix.size(), pos1 - kPrefix.size()));
    } catch (const std::exception&) {
        return false;
    }
    if (iterations <= 0) {
        return false;
    }

    std::vector<unsigned char> salt;
    std::vector<unsigned char> expected;
    if (!fromHex(encoded.substr(pos1 + 1, pos2 - pos1 - 1), salt) ||
        !fromHex(encoded.substr(pos2 + 1), expected) ||
        salt.empty() || expected.size() != static_cast<std::size_t>(kKeyLength)) {
        return false;
    }

    unsigned char computed[kKeyLength];
    if (!derive(plaintext, salt.data(), static_cast<int>(salt.size()), iterations, computed, kKeyLength)) {
        return false;
    }

    return CRYPTO_memcmp(computed, expected.data(), kKeyLength) == 0;
}

} // namespace catalog::utils
