#pragma once

#include <string>

namespace catalog::utils {

/**
 * @brief Хэширование паролей: PBKDF2-HMAC-SHA256 (OpenSSL)
 *
 * Формат: $pbkdf2-sha256$<iterations>$<salt hex>$<key hex>
 */
class PasswordHasher {
public:
    static constexpr int kIterations = 100000;
    static constexpr int kSaltLength = 16;
    static constexpr int kKeyLength = 32;

    /**
     * @throws domain::DomainError GENERATION если не удалось получить соль
     */
    static std::string hash(const std::string& plaintext);

    /**
     * @brief Сравнение за постоянное время (CRYPTO_memcmp)
     * @return false для любого нераспознанного формата
     */
    static bool verify(const std::string& plaintext, const std::string& encoded);
};

} // namespace catalog::utils
