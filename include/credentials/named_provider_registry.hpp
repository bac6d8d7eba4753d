#pragma once

#include "credentials/icredentials_provider.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace credchain {

/**
 * @brief Read-only mapping from source name to a shared credentials provider
 *
 * Built once from a complete map and never mutated afterwards, so a single
 * registry can be shared across threads and chain builds without locking.
 * A miss is reported as nullptr; callers decide whether that is an error.
 *
 * Usage:
 *   NamedProviderRegistry registry({
 *       {"Environment", std::make_shared<EnvironmentCredentialsProvider>()}});
 *   auto provider = registry.lookup("Environment");
 */
class NamedProviderRegistry {
public:
    using ProviderMap = std::unordered_map<std::string, std::shared_ptr<const ICredentialsProvider>>;

    NamedProviderRegistry() = default;
    explicit NamedProviderRegistry(ProviderMap providers);

    /**
     * @brief Find a provider by exact (case-sensitive) name
     * @return Shared handle, or nullptr when no provider has that name
     */
    [[nodiscard]] std::shared_ptr<const ICredentialsProvider> lookup(const std::string& name) const;

    [[nodiscard]] bool contains(const std::string& name) const {
        return providers_.contains(name);
    }

    [[nodiscard]] size_t size() const { return providers_.size(); }

    /**
     * @brief Registered names, sorted (for diagnostics)
     */
    [[nodiscard]] std::vector<std::string> names() const;

private:
    ProviderMap providers_;
};

} // namespace credchain
