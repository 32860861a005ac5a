#pragma once

#include "ports/output/ITokenRepository.hpp"
#include "adapters/secondary/PostgresSupport.hpp"
#include "adapters/secondary/PostgresUserRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace catalog::adapters::secondary {

/**
 * @brief Токены в PostgreSQL
 *
 * Таблица tokens: hash bytea PRIMARY KEY, user_id, expiry, scope.
 * hash приходит hex-строкой и декодируется на стороне БД.
 */
class PostgresTokenRepository : public ports::output::ITokenRepository {
public:
    explicit PostgresTokenRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresTokenRepository] Created for " << settings_->getName() << std::endl;
    }

    void insert(const domain::Token& token) override {
        withTransaction(*settings_, "PostgresTokenRepository", [&](pqxx::work& txn) {
            txn.exec_params(
                R"(
                    INSERT INTO tokens (hash, user_id, expiry, scope)
                    VALUES (decode($1, 'hex'), $2, to_timestamp($3), $4)
                )",
                token.hash,
                token.userId,
                toEpochSeconds(token.expiry),
                domain::toString(token.scope)
            );
            txn.commit();
        });
    }

    std::optional<domain::User> findUserByToken(
        domain::TokenScope scope,
        const std::string& hash,
        std::chrono::system_clock::time_point now) override
    {
        return withTransaction(*settings_, "PostgresTokenRepository", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                R"(
                    SELECT users.id, users.name, users.email, users.password_hash, users.activated,
                           users.version, EXTRACT(EPOCH FROM users.created_at)::bigint AS created_epoch
                    FROM users
                    INNER JOIN tokens ON users.id = tokens.user_id
                    WHERE tokens.hash = decode($1, 'hex')
                    AND tokens.scope = $2
                    AND tokens.expiry > to_timestamp($3)
                )",
                hash,
                domain::toString(scope),
                toEpochSeconds(now)
            );
            txn.commit();

            if (result.empty()) return std::optional<domain::User>{};
            return std::optional<domain::User>{PostgresUserRepository::rowToUser(result[0])};
        });
    }

    void deleteAllForUser(domain::TokenScope scope, int64_t userId) override {
        withTransaction(*settings_, "PostgresTokenRepository", [&](pqxx::work& txn) {
            txn.exec_params(
                "DELETE FROM tokens WHERE scope = $1 AND user_id = $2",
                domain::toString(scope),
                userId
            );
            txn.commit();
        });
    }

    std::size_t deleteExpired(std::chrono::system_clock::time_point now) override {
        return withTransaction(*settings_, "PostgresTokenRepository", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                "DELETE FROM tokens WHERE expiry <= to_timestamp($1)",
                toEpochSeconds(now)
            );
            txn.commit();
            return static_cast<std::size_t>(result.affected_rows());
        });
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    static int64_t toEpochSeconds(std::chrono::system_clock::time_point tp) {
        return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    }
};

} // namespace catalog::adapters::secondary
