#pragma once

#include "credentials/credentials.hpp"
#include "sts/client_configuration.hpp"

#include <optional>
#include <stop_token>
#include <string>

namespace credchain {

/**
 * @brief One delegation step: assume `role_arn` using upstream credentials
 *
 * Immutable; safe to execute concurrently from several chain executions.
 * A missing session name is defaulted at execution time (each call gets a
 * fresh name from the configured generator), never at construction.
 */
class AssumeRoleHop {
public:
    static constexpr const char* kProviderName = "AssumeRoleProvider";

    AssumeRoleHop(std::string role_arn,
                  std::optional<std::string> external_id = std::nullopt,
                  std::optional<std::string> session_name = std::nullopt);

    [[nodiscard]] const std::string& role_arn() const { return role_arn_; }
    [[nodiscard]] const std::optional<std::string>& external_id() const { return external_id_; }
    [[nodiscard]] const std::optional<std::string>& session_name() const { return session_name_; }

    /**
     * @brief Build the request this hop would send
     */
    [[nodiscard]] sts::AssumeRoleRequest make_request(const sts::ClientConfiguration& client_config) const;

    /**
     * @brief Execute the hop: one AssumeRole round trip
     * @param input_credentials Caller identity for the call (previous hop or base)
     * @param client_config Client, region and session-name generator
     * @param stop Cancellation; a stopped hop yields CANCELLED and no credentials
     * @return New credentials attributed to this hop, or PROVIDER_ERROR wrapping
     *         the transport/service failure. Never retries.
     */
    [[nodiscard]] CredentialsResult credentials(const Credentials& input_credentials,
                                                const sts::ClientConfiguration& client_config,
                                                std::stop_token stop = {}) const;

private:
    std::string role_arn_;
    std::optional<std::string> external_id_;
    std::optional<std::string> session_name_;
};

} // namespace credchain
