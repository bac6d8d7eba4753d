#pragma once

#include "chain/assume_role_hop.hpp"
#include "credentials/icredentials_provider.hpp"

#include <memory>
#include <span>
#include <vector>

namespace credchain {

/**
 * @brief A resolved chain: base provider plus ordered delegation hops
 *
 * Immutable after construction. The base was resolved exactly once by
 * ChainBuilder; executing the chain never consults a registry again.
 */
class ProviderChain {
public:
    ProviderChain(std::shared_ptr<const ICredentialsProvider> base,
                  std::vector<AssumeRoleHop> hops)
        : base_(std::move(base)), hops_(std::move(hops)) {}

    [[nodiscard]] const ICredentialsProvider& base() const { return *base_; }
    [[nodiscard]] const std::shared_ptr<const ICredentialsProvider>& base_handle() const { return base_; }

    // Declaration order
    [[nodiscard]] std::span<const AssumeRoleHop> hops() const { return hops_; }

private:
    std::shared_ptr<const ICredentialsProvider> base_;
    std::vector<AssumeRoleHop> hops_;
};

} // namespace credchain
