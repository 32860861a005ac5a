#pragma once

#include <string>
#include <cstdlib>

namespace catalog::settings {

/**
 * @brief Время жизни токенов из ENV
 */
class AuthSettings {
public:
    AuthSettings() {
        authenticationTokenLifetimeSeconds_ = std::stoi(getEnvOrDefault("CATALOG_AUTH_TOKEN_TTL", "86400"));
        activationTokenLifetimeSeconds_ = std::stoi(getEnvOrDefault("CATALOG_ACTIVATION_TOKEN_TTL", "259200"));
    }

    int getAuthenticationTokenLifetimeSeconds() const { return authenticationTokenLifetimeSeconds_; }
    int getActivationTokenLifetimeSeconds() const { return activationTokenLifetimeSeconds_; }

private:
    int authenticationTokenLifetimeSeconds_;
    int activationTokenLifetimeSeconds_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }
};

} // namespace catalog::settings
