#pragma once

#include "credentials/icredentials_provider.hpp"

#include <optional>
#include <string>

namespace credchain {

/**
 * @brief Fixed access key / secret key pair held in memory
 *
 * Never performs I/O; provide_credentials() returns a ready future.
 */
class StaticCredentialsProvider : public ICredentialsProvider {
public:
    static constexpr const char* kProviderName = "Static";

    StaticCredentialsProvider(std::string access_key_id,
                              std::string secret_access_key,
                              std::optional<std::string> session_token = std::nullopt);

    [[nodiscard]] std::future<CredentialsResult> provide_credentials(std::stop_token stop) const override;
    [[nodiscard]] std::string name() const override { return kProviderName; }

    [[nodiscard]] const Credentials& credentials() const { return credentials_; }

private:
    Credentials credentials_;
};

} // namespace credchain
