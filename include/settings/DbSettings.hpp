#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace catalog::settings {

/**
 * @brief Настройки подключения к PostgreSQL
 *
 * Читает параметры из переменных окружения.
 * timeoutMs — statement_timeout каждой операции, connect_timeout
 * берётся из него же (округление вверх до секунды).
 */
class DbSettings {
public:
    DbSettings() {
        host_ = getEnvOrDefault("CATALOG_DB_HOST", "localhost");
        port_ = std::stoi(getEnvOrDefault("CATALOG_DB_PORT", "5432"));
        name_ = getEnvOrDefault("CATALOG_DB_NAME", "catalog_db");
        user_ = getEnvOrDefault("CATALOG_DB_USER", "catalog_user");
        password_ = getEnvOrDefault("CATALOG_DB_PASSWORD", "catalog_secret_password");
        timeoutMs_ = std::stoi(getEnvOrDefault("CATALOG_DB_TIMEOUT_MS", "3000"));
        if (timeoutMs_ <= 0) {
            throw std::invalid_argument("CATALOG_DB_TIMEOUT_MS must be positive");
        }
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return name_; }
    std::string getUser() const { return user_; }
    std::string getPassword() const { return password_; }
    int getTimeoutMs() const { return timeoutMs_; }

    std::string getConnectionString() const {
        int connectTimeoutSec = (timeoutMs_ + 999) / 1000;
        return "host=" + host_ +
               " port=" + std::to_string(port_) +
               " dbname=" + name_ +
               " user=" + user_ +
               " password=" + password_ +
               " connect_timeout=" + std::to_string(connectTimeoutSec);
    }

private:
    std::string host_;
    int port_;
    std::string name_;
    std::string user_;
    std::string password_;
    int timeoutMs_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace catalog::settings
