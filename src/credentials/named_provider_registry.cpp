#include "credentials/named_provider_registry.hpp"

#include <algorithm>

namespace credchain {

NamedProviderRegistry::NamedProviderRegistry(ProviderMap providers)
    : providers_(std::move(providers)) {}

std::shared_ptr<const ICredentialsProvider> NamedProviderRegistry::lookup(const std::string& name) const {
    const auto it = providers_.find(name);
    if (it == providers_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::string> NamedProviderRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(providers_.size());
    for (const auto& [name, provider] : providers_) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace credchain
