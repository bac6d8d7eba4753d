#pragma once

#include "credentials/credentials.hpp"
#include "sts/sts_types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace credchain::sts {

// Purpose tags for defaulted session names
inline constexpr std::string_view kAssumeRolePurpose = "assume-role-from-profile";
inline constexpr std::string_view kWebIdentityPurpose = "web-identity-token-profile";

/**
 * @brief Produces a role session name for a purpose tag
 *
 * The single seam for defaulted session names. Tests substitute a
 * deterministic generator; production uses default_session_name().
 */
using SessionNameGenerator = std::function<std::string(std::string_view purpose)>;

/**
 * @brief "<purpose>-<unix epoch millis>"
 */
[[nodiscard]] std::string default_session_name(std::string_view purpose);

/**
 * @brief Validate service-issued credentials and convert to Credentials
 * @param sts_credentials Credentials block from the response (may be absent)
 * @param provider_name Attributed as Credentials::provider_name
 */
[[nodiscard]] CredentialsResult into_credentials(
    const std::optional<StsCredentials>& sts_credentials,
    const std::string& provider_name);

} // namespace credchain::sts
