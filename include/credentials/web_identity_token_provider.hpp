#pragma once

#include "credentials/icredentials_provider.hpp"
#include "sts/client_configuration.hpp"

#include <string>

namespace credchain {

/**
 * @brief Role + token file pair for web identity federation
 */
struct WebIdentityTokenRole {
    std::string web_identity_token_file;
    std::string role_arn;
    std::string session_name;
};

/**
 * @brief Exchanges a web identity token (read from a file) for credentials
 *
 * Construction performs no I/O. Each provide_credentials() call reads the
 * token file afresh and issues one unsigned AssumeRoleWithWebIdentity call.
 */
class WebIdentityTokenProvider : public ICredentialsProvider {
public:
    static constexpr const char* kProviderName = "WebIdentityToken";

    WebIdentityTokenProvider(WebIdentityTokenRole role, sts::ClientConfiguration client_config);

    [[nodiscard]] std::future<CredentialsResult> provide_credentials(std::stop_token stop) const override;
    [[nodiscard]] std::string name() const override { return kProviderName; }

    [[nodiscard]] const WebIdentityTokenRole& role() const { return role_; }

private:
    WebIdentityTokenRole role_;
    sts::ClientConfiguration client_config_;
};

} // namespace credchain
