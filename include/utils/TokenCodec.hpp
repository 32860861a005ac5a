#pragma once

#include "domain/Token.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace catalog::utils {

/**
 * @brief Выпуск и хэширование bearer токенов
 *
 * Токен — 16 байт из RAND_bytes, закодированные base32 без паддинга
 * (26 символов). В хранилище уходит только SHA-256 от этой строки.
 *
 * @note Thread-safe: состояния нет, RAND_bytes потокобезопасен
 */
class TokenCodec {
public:
    static constexpr std::size_t kEntropyBytes = 16;
    static constexpr std::size_t kPlaintextLength = 26;

    /**
     * @brief Сгенерировать новый токен
     *
     * @param userId владелец
     * @param ttl время жизни
     * @param scope назначение
     * @return plaintext (для клиента) + Token (для хранилища)
     * @throws domain::DomainError GENERATION если нет энтропии
     */
    static domain::IssuedToken issue(int64_t userId, std::chrono::seconds ttl, domain::TokenScope scope);

    /**
     * @brief SHA-256(plaintext) в hex
     */
    static std::string hash(const std::string& plaintext);

    /**
     * @brief Проверка формата: ровно 26 символов
     */
    static bool isWellFormed(const std::string& plaintext) {
        return plaintext.size() == kPlaintextLength;
    }

    /**
     * @brief RFC 4648 base32, без '='
     */
    static std::string base32Encode(const unsigned char* data, std::size_t len);
};

} // namespace catalog::utils
