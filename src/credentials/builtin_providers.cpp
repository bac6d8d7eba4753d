#include "credentials/builtin_providers.hpp"
#include "credentials/environment_credentials_provider.hpp"

#include <algorithm>
#include <format>

namespace credchain {

const std::vector<std::string>& builtin_source_names() {
    static const std::vector<std::string> names = {
        EnvironmentCredentialsProvider::kProviderName,
    };
    return names;
}

bool is_builtin_source(const std::string& name) {
    const auto& names = builtin_source_names();
    return std::find(names.begin(), names.end(), name) != names.end();
}

Result<NamedProviderRegistry> make_builtin_registry(const std::vector<std::string>& enabled,
                                                    NamedProviderRegistry::ProviderMap extra) {
    for (const auto& name : enabled) {
        if (!is_builtin_source(name)) {
            return Result<NamedProviderRegistry>::error(ErrorCategory::INVALID_CONFIGURATION,
                std::format("unknown builtin credential source `{}`", name));
        }
        if (extra.contains(name)) continue;

        if (name == EnvironmentCredentialsProvider::kProviderName) {
            extra.emplace(name, std::make_shared<const EnvironmentCredentialsProvider>());
        }
    }
    return Result<NamedProviderRegistry>::ok(NamedProviderRegistry(std::move(extra)));
}

} // namespace credchain
