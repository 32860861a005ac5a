#pragma once

#include "ports/output/IUserRepository.hpp"
#include "adapters/secondary/PostgresSupport.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace catalog::adapters::secondary {

class PostgresUserRepository : public ports::output::IUserRepository {
public:
    explicit PostgresUserRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresUserRepository] Created for " << settings_->getName() << std::endl;
    }

    void insert(domain::User& user) override {
        withTransaction(*settings_, "PostgresUserRepository", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                R"(
                    INSERT INTO users (name, email, password_hash, activated)
                    VALUES ($1, $2, $3, $4)
                    RETURNING id, version, EXTRACT(EPOCH FROM created_at)::bigint AS created_epoch
                )",
                user.name,
                user.email,
                user.passwordHash,
                user.activated
            );
            txn.commit();

            user.id = result[0]["id"].as<int64_t>();
            user.version = result[0]["version"].as<int32_t>();
            user.createdAt = domain::Timestamp::fromEpochSeconds(result[0]["created_epoch"].as<int64_t>());
        });
    }

    std::optional<domain::User> findByEmail(const std::string& email) override {
        return withTransaction(*settings_, "PostgresUserRepository", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                R"(SELECT id, name, email, password_hash, activated, version,
                          EXTRACT(EPOCH FROM created_at)::bigint AS created_epoch
                   FROM users WHERE email = $1)",
                email
            );
            txn.commit();

            if (result.empty()) return std::optional<domain::User>{};
            return std::optional<domain::User>{rowToUser(result[0])};
        });
    }

    void update(domain::User& user) override {
        withTransaction(*settings_, "PostgresUserRepository", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                R"(
                    UPDATE users
                    SET name = $1, email = $2, password_hash = $3, activated = $4, version = version + 1
                    WHERE id = $5 AND version = $6
                    RETURNING version
                )",
                user.name,
                user.email,
                user.passwordHash,
                user.activated,
                user.id,
                user.version
            );

            if (result.empty()) {
                throw domain::DomainError::editConflict();
            }
            txn.commit();
            user.version = result[0]["version"].as<int32_t>();
        });
    }

    /**
     * @brief Общий маппинг строки users (используется и для JOIN с tokens)
     */
    static domain::User rowToUser(const pqxx::row& row) {
        domain::User user;
        user.id = row["id"].as<int64_t>();
        user.name = row["name"].as<std::string>();
        user.email = row["email"].as<std::string>();
        user.passwordHash = row["password_hash"].as<std::string>();
        user.activated = row["activated"].as<bool>();
        user.version = row["version"].as<int32_t>();
        user.createdAt = domain::Timestamp::fromEpochSeconds(row["created_epoch"].as<int64_t>());
        return user;
    }

    bool remove(int64_t id) override {
        return withTransaction(*settings_, "PostgresUserRepository", [&](pqxx::work& txn) {
            // tokens.user_id ON DELETE CASCADE
            auto result = txn.exec_params("DELETE FROM users WHERE id = $1", id);
            txn.commit();
            return result.affected_rows() > 0;
        });
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace catalog::adapters::secondary
