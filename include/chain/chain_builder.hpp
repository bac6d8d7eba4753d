#pragma once

#include "chain/chain_spec.hpp"
#include "chain/provider_chain.hpp"
#include "credentials/named_provider_registry.hpp"
#include "sts/client_configuration.hpp"

namespace credchain {

/**
 * @brief Resolves a declarative ProfileChain into a ProviderChain
 *
 * Resolution is synchronous and performs no network I/O:
 * - NamedSource: registry lookup; a miss fails with UNKNOWN_PROVIDER before
 *   any hop is built.
 * - StaticKeyPair: wrapped in a StaticCredentialsProvider.
 * - FederatedTokenRole: a WebIdentityTokenProvider with the session name
 *   defaulted from the "web-identity-token-profile" purpose.
 * Hops are mapped 1:1 in declaration order, role ARNs are not validated.
 *
 * Usage:
 *   ChainBuilder builder(client_config);
 *   auto chain = builder.build(registry, profile_chain);
 *   if (chain.is_error()) { ... chain.error_message() ... }
 */
class ChainBuilder {
public:
    explicit ChainBuilder(sts::ClientConfiguration client_config);

    [[nodiscard]] Result<ProviderChain> build(const NamedProviderRegistry& registry,
                                              const ProfileChain& profile_chain) const;

private:
    [[nodiscard]] Result<std::shared_ptr<const ICredentialsProvider>> resolve_base(
        const NamedProviderRegistry& registry,
        const BaseProviderSpec& base) const;

    sts::ClientConfiguration client_config_;
};

} // namespace credchain
