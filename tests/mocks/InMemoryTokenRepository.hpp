#pragma once

#include "ports/output/ITokenRepository.hpp"
#include "mocks/InMemoryUserRepository.hpp"
#include "domain/DomainError.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace catalog::tests::mocks {

/**
 * @brief In-Memory хранилище токенов
 *
 * Владельца ищет в InMemoryUserRepository, как JOIN users в SQL.
 */
class InMemoryTokenRepository : public ports::output::ITokenRepository {
public:
    explicit InMemoryTokenRepository(std::shared_ptr<InMemoryUserRepository> users)
        : users_(std::move(users)) {}

    void insert(const domain::Token& token) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (insertFailure_) {
            throw domain::DomainError(*insertFailure_, "token insert failed");
        }
        if (tokens_.count(token.hash) > 0) {
            throw domain::DomainError::conflict("duplicate key");
        }
        tokens_[token.hash] = token;
    }

    std::optional<domain::User> findUserByToken(
        domain::TokenScope scope,
        const std::string& hash,
        std::chrono::system_clock::time_point now) override
    {
        int64_t userId = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = tokens_.find(hash);
            if (it == tokens_.end() || it->second.scope != scope || it->second.isExpired(now)) {
                return std::nullopt;
            }
            userId = it->second.userId;
        }
        return users_->findById(userId);
    }

    void deleteAllForUser(domain::TokenScope scope, int64_t userId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = tokens_.begin(); it != tokens_.end();) {
            if (it->second.scope == scope && it->second.userId == userId) {
                it = tokens_.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::size_t deleteExpired(std::chrono::system_clock::time_point now) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t removed = 0;
        for (auto it = tokens_.begin(); it != tokens_.end();) {
            if (it->second.isExpired(now)) {
                it = tokens_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    // Test helpers
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tokens_.size();
    }

    size_t countFor(int64_t userId, domain::TokenScope scope) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& [hash, token] : tokens_) {
            if (token.userId == userId && token.scope == scope) ++n;
        }
        return n;
    }

    bool containsHash(const std::string& hash) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tokens_.count(hash) > 0;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        tokens_.clear();
    }

    /// Все последующие insert бросают DomainError с этим kind
    void failInsertsWith(domain::ErrorKind kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        insertFailure_ = kind;
    }

private:
    std::shared_ptr<InMemoryUserRepository> users_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, domain::Token> tokens_;  // hash -> token
    std::optional<domain::ErrorKind> insertFailure_;
};

} // namespace catalog::tests::mocks
