#pragma once

#include "core/error.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>

namespace credchain {

/**
 * @brief A set of (possibly temporary) AWS-style credentials
 *
 * Produced by base providers and by every delegation hop. Values are
 * replaced, never mutated, as they flow down a chain.
 */
struct Credentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::optional<std::string> session_token;
    std::optional<std::chrono::system_clock::time_point> expiration;
    std::string provider_name;   // Which provider produced these (error attribution)

    Credentials() = default;
    Credentials(std::string access_key, std::string secret_key,
                std::optional<std::string> token,
                std::optional<std::chrono::system_clock::time_point> expires,
                std::string provider)
        : access_key_id(std::move(access_key)),
          secret_access_key(std::move(secret_key)),
          session_token(std::move(token)),
          expiration(expires),
          provider_name(std::move(provider)) {}

    bool operator==(const Credentials&) const = default;

    /**
     * @brief Printable form that never includes the secret or token
     */
    [[nodiscard]] std::string redacted() const;
};

using CredentialsResult = Result<Credentials>;

} // namespace credchain
