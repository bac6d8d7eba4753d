#pragma once

#include "credentials/icredentials_provider.hpp"

#include <string>

namespace credchain {

/**
 * @brief Builtin "Environment" named source
 *
 * Reads AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY / AWS_SESSION_TOKEN each
 * time credentials are requested (not at construction), so a registry can
 * be built before the environment is populated.
 */
class EnvironmentCredentialsProvider : public ICredentialsProvider {
public:
    static constexpr const char* kProviderName = "Environment";

    static constexpr const char* kAccessKeyVar = "AWS_ACCESS_KEY_ID";
    static constexpr const char* kSecretKeyVar = "AWS_SECRET_ACCESS_KEY";
    static constexpr const char* kSessionTokenVar = "AWS_SESSION_TOKEN";

    [[nodiscard]] std::future<CredentialsResult> provide_credentials(std::stop_token stop) const override;
    [[nodiscard]] std::string name() const override { return kProviderName; }

private:
    [[nodiscard]] CredentialsResult load() const;
};

} // namespace credchain
