#pragma once

#include "credentials/named_provider_registry.hpp"

#include <string>
#include <vector>

namespace credchain {

/**
 * @brief Names of the named sources credchain can construct itself
 */
[[nodiscard]] const std::vector<std::string>& builtin_source_names();

[[nodiscard]] bool is_builtin_source(const std::string& name);

/**
 * @brief Registry holding the enabled builtin sources plus caller-supplied ones
 *
 * Caller-supplied providers win over builtins of the same name.
 * Fails with INVALID_CONFIGURATION on an unknown builtin name.
 */
[[nodiscard]] Result<NamedProviderRegistry> make_builtin_registry(
    const std::vector<std::string>& enabled,
    NamedProviderRegistry::ProviderMap extra = {});

} // namespace credchain
