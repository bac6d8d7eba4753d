#include "chain/chain_credentials_provider.hpp"

namespace credchain {

ChainCredentialsProvider::ChainCredentialsProvider(std::string name,
                                                   std::shared_ptr<const ProviderChain> chain,
                                                   sts::ClientConfiguration client_config)
    : name_(std::move(name)),
      chain_(std::move(chain)),
      executor_(std::move(client_config)) {}

std::future<CredentialsResult> ChainCredentialsProvider::provide_credentials(std::stop_token stop) const {
    if (!chain_) {
        return make_ready_credentials(CredentialsResult::error(
            ErrorCategory::INVALID_CONFIGURATION, "no chain configured for provider " + name_));
    }
    return std::async(std::launch::deferred,
        [chain = chain_, executor = executor_, stop = std::move(stop)]() {
            return executor.execute(*chain, stop);
        });
}

} // namespace credchain
