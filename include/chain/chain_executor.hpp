#pragma once

#include "chain/provider_chain.hpp"
#include "sts/client_configuration.hpp"

#include <stop_token>

namespace credchain {

/**
 * @brief Runs a ProviderChain: base provider, then each hop in order
 *
 * Strictly sequential. The credentials produced by step k are the only
 * caller identity passed to step k+1. Execution halts at the first failure,
 * which is returned with its position in the chain and the original cause;
 * no partial credentials are ever returned. Each execute() call keeps its own
 * in-flight credentials, so one executor and one chain can serve many
 * concurrent executions.
 */
class ChainExecutor {
public:
    explicit ChainExecutor(sts::ClientConfiguration client_config);

    [[nodiscard]] CredentialsResult execute(const ProviderChain& chain,
                                            std::stop_token stop = {}) const;

private:
    [[nodiscard]] CredentialsResult load_base(const ProviderChain& chain,
                                              const std::stop_token& stop) const;

    sts::ClientConfiguration client_config_;
};

} // namespace credchain
