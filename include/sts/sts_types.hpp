#pragma once

#include "credentials/credentials.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace credchain::sts {

/**
 * @brief Temporary credentials as returned on the wire
 *
 * Every field is optional because the service response is not trusted to be
 * complete; into_credentials() validates it.
 */
struct StsCredentials {
    std::optional<std::string> access_key_id;
    std::optional<std::string> secret_access_key;
    std::optional<std::string> session_token;
    std::optional<std::chrono::system_clock::time_point> expiration;
};

struct AssumeRoleRequest {
    std::string role_arn;
    std::optional<std::string> external_id;
    std::string role_session_name;
};

struct AssumeRoleWithWebIdentityRequest {
    std::string role_arn;
    std::string role_session_name;
    std::string web_identity_token;
};

struct AssumeRoleResponse {
    std::optional<StsCredentials> credentials;
    std::string assumed_role_arn;   // May be empty
};

/**
 * @brief Per-call configuration: who is calling and where
 *
 * No caller credentials means an unsigned request (web identity federation).
 */
struct StsCallConfig {
    std::optional<Credentials> caller;
    std::optional<std::string> region;
};

using AssumeRoleResult = Result<AssumeRoleResponse>;

} // namespace credchain::sts
