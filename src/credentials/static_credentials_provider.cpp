#include "credentials/static_credentials_provider.hpp"

namespace credchain {

StaticCredentialsProvider::StaticCredentialsProvider(std::string access_key_id,
                                                     std::string secret_access_key,
                                                     std::optional<std::string> session_token)
    : credentials_(std::move(access_key_id), std::move(secret_access_key),
                   std::move(session_token), std::nullopt, kProviderName) {}

std::future<CredentialsResult> StaticCredentialsProvider::provide_credentials(std::stop_token /*stop*/) const {
    return make_ready_credentials(CredentialsResult::ok(credentials_));
}

} // namespace credchain
