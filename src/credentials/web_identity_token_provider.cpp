#include "credentials/web_identity_token_provider.hpp"
#include "core/await.hpp"
#include "core/utils.hpp"

#include <format>
#include <fstream>
#include <sstream>

namespace credchain {

namespace {

Result<std::string> read_token_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Result<std::string>::error(ErrorCategory::PROVIDER_ERROR,
            std::format("could not read web identity token file '{}'", path));
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    std::string token = utils::trim(contents.str());
    if (token.empty()) {
        return Result<std::string>::error(ErrorCategory::PROVIDER_ERROR,
            std::format("web identity token file '{}' is empty", path));
    }
    return Result<std::string>::ok(std::move(token));
}

CredentialsResult load(const WebIdentityTokenRole& role,
                       const sts::ClientConfiguration& config,
                       const std::stop_token& stop) {
    const auto provider_error = [](std::string message) {
        Error e;
        e.category = ErrorCategory::PROVIDER_ERROR;
        e.message = std::move(message);
        e.source = WebIdentityTokenProvider::kProviderName;
        return e;
    };

    if (!config.client) {
        return CredentialsResult::error(provider_error("no STS client configured"));
    }

    auto token = read_token_file(role.web_identity_token_file);
    if (token.is_error()) {
        return CredentialsResult::error(provider_error(token.error_message()));
    }

    sts::AssumeRoleWithWebIdentityRequest request;
    request.role_arn = role.role_arn;
    request.role_session_name = role.session_name;
    request.web_identity_token = std::move(token.value());

    sts::StsCallConfig call_config;
    call_config.region = config.region;

    if (stop.stop_requested()) {
        return CredentialsResult::error(ErrorCategory::CANCELLED, "operation cancelled");
    }
    auto future = config.client->assume_role_with_web_identity(request, call_config, stop);
    auto response = await_result(future, stop, config.poll_interval);
    if (response.is_error()) {
        if (response.error_category() == ErrorCategory::CANCELLED) {
            return CredentialsResult::error(response.error());
        }
        return CredentialsResult::error(Error::wrap(
            ErrorCategory::PROVIDER_ERROR,
            std::format("failed to assume role {} with web identity token", role.role_arn),
            WebIdentityTokenProvider::kProviderName,
            response.error()));
    }

    return sts::into_credentials(response.value().credentials,
                                 WebIdentityTokenProvider::kProviderName);
}

} // anonymous namespace

WebIdentityTokenProvider::WebIdentityTokenProvider(WebIdentityTokenRole role,
                                                   sts::ClientConfiguration client_config)
    : role_(std::move(role)), client_config_(std::move(client_config)) {}

std::future<CredentialsResult> WebIdentityTokenProvider::provide_credentials(std::stop_token stop) const {
    // Copies keep the deferred task independent of this provider's lifetime
    return std::async(std::launch::deferred,
        [role = role_, config = client_config_, stop = std::move(stop)]() {
            return load(role, config, stop);
        });
}

} // namespace credchain
