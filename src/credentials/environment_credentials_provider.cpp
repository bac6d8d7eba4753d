#include "credentials/environment_credentials_provider.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <optional>

namespace credchain {

namespace {

std::optional<std::string> read_env(const char* var) {
    const char* value = std::getenv(var);
    if (!value) return std::nullopt;
    std::string trimmed = utils::trim(value);
    if (trimmed.empty()) return std::nullopt;
    return trimmed;
}

} // anonymous namespace

std::future<CredentialsResult> EnvironmentCredentialsProvider::provide_credentials(std::stop_token /*stop*/) const {
    return make_ready_credentials(load());
}

CredentialsResult EnvironmentCredentialsProvider::load() const {
    auto access_key = read_env(kAccessKeyVar);
    if (!access_key) {
        Error e;
        e.category = ErrorCategory::CREDENTIALS_NOT_LOADED;
        e.message = std::format("environment variable not set: {}", kAccessKeyVar);
        e.source = kProviderName;
        return CredentialsResult::error(std::move(e));
    }

    auto secret_key = read_env(kSecretKeyVar);
    if (!secret_key) {
        Error e;
        e.category = ErrorCategory::CREDENTIALS_NOT_LOADED;
        e.message = std::format("environment variable not set: {}", kSecretKeyVar);
        e.source = kProviderName;
        return CredentialsResult::error(std::move(e));
    }

    utils::log::debug(std::format("EnvironmentCredentialsProvider: loaded access key {}", *access_key));

    return CredentialsResult::ok(Credentials(
        std::move(*access_key), std::move(*secret_key),
        read_env(kSessionTokenVar), std::nullopt, kProviderName));
}

} // namespace credchain
