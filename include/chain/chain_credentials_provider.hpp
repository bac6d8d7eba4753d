#pragma once

#include "chain/chain_executor.hpp"
#include "chain/provider_chain.hpp"
#include "credentials/icredentials_provider.hpp"

#include <memory>
#include <string>

namespace credchain {

/**
 * @brief Exposes a resolved chain as an ordinary credentials provider
 *
 * Lets a fully resolved chain be registered as a named source of another
 * registry. Every call runs the whole chain; nothing is cached.
 */
class ChainCredentialsProvider : public ICredentialsProvider {
public:
    ChainCredentialsProvider(std::string name,
                             std::shared_ptr<const ProviderChain> chain,
                             sts::ClientConfiguration client_config);

    [[nodiscard]] std::future<CredentialsResult> provide_credentials(std::stop_token stop) const override;
    [[nodiscard]] std::string name() const override { return name_; }

private:
    std::string name_;
    std::shared_ptr<const ProviderChain> chain_;
    ChainExecutor executor_;
};

} // namespace credchain
