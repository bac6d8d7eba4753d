#include "sts/sts_util.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <format>

namespace credchain::sts {

std::string default_session_name(std::string_view purpose) {
    return std::format("{}-{}", purpose, utils::unix_millis(std::chrono::system_clock::now()));
}

CredentialsResult into_credentials(const std::optional<StsCredentials>& sts_credentials,
                                   const std::string& provider_name) {
    const auto unhandled = [&provider_name](std::string message) {
        Error e;
        e.category = ErrorCategory::UNHANDLED;
        e.message = std::move(message);
        e.source = provider_name;
        return CredentialsResult::error(std::move(e));
    };

    if (!sts_credentials) {
        return unhandled("STS credentials must be defined");
    }
    if (!sts_credentials->expiration) {
        return unhandled("missing expiration");
    }
    if (!sts_credentials->access_key_id) {
        return unhandled("access key id missing from result");
    }
    if (!sts_credentials->secret_access_key) {
        return unhandled("secret access token missing");
    }

    return CredentialsResult::ok(Credentials(
        *sts_credentials->access_key_id,
        *sts_credentials->secret_access_key,
        sts_credentials->session_token,
        sts_credentials->expiration,
        provider_name));
}

} // namespace credchain::sts
