#include "chain/assume_role_hop.hpp"
#include "core/await.hpp"
#include "core/utils.hpp"
#include "sts/sts_util.hpp"

#include <format>

namespace credchain {

AssumeRoleHop::AssumeRoleHop(std::string role_arn,
                             std::optional<std::string> external_id,
                             std::optional<std::string> session_name)
    : role_arn_(std::move(role_arn)),
      external_id_(std::move(external_id)),
      session_name_(std::move(session_name)) {}

sts::AssumeRoleRequest AssumeRoleHop::make_request(const sts::ClientConfiguration& client_config) const {
    sts::AssumeRoleRequest request;
    request.role_arn = role_arn_;
    request.external_id = external_id_;
    if (session_name_) {
        request.role_session_name = *session_name_;
    } else if (client_config.session_name_generator) {
        request.role_session_name = client_config.session_name_generator(sts::kAssumeRolePurpose);
    } else {
        request.role_session_name = sts::default_session_name(sts::kAssumeRolePurpose);
    }
    return request;
}

CredentialsResult AssumeRoleHop::credentials(const Credentials& input_credentials,
                                             const sts::ClientConfiguration& client_config,
                                             std::stop_token stop) const {
    if (stop.stop_requested()) {
        return CredentialsResult::error(ErrorCategory::CANCELLED,
            std::format("assume role {} cancelled", role_arn_));
    }
    if (!client_config.client) {
        Error e;
        e.category = ErrorCategory::PROVIDER_ERROR;
        e.message = std::format("cannot assume role {}: no STS client configured", role_arn_);
        e.source = kProviderName;
        return CredentialsResult::error(std::move(e));
    }

    sts::StsCallConfig call_config;
    call_config.caller = input_credentials;
    call_config.region = client_config.region;

    const auto request = make_request(client_config);
    utils::log::debug(std::format("AssumeRoleProvider: assuming {} as session '{}' (caller {})",
        request.role_arn, request.role_session_name, input_credentials.access_key_id));

    auto future = client_config.client->assume_role(request, call_config, stop);
    auto response = await_result(future, stop, client_config.poll_interval);

    if (response.is_error()) {
        if (response.error_category() == ErrorCategory::CANCELLED) {
            return CredentialsResult::error(response.error());
        }
        return CredentialsResult::error(Error::wrap(
            ErrorCategory::PROVIDER_ERROR,
            std::format("failed to assume role {}", role_arn_),
            kProviderName,
            response.error()));
    }

    return sts::into_credentials(response.value().credentials, kProviderName);
}

} // namespace credchain
