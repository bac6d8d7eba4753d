#pragma once

#include "config/config_types.hpp"
#include "credentials/named_provider_registry.hpp"
#include "sts/client_configuration.hpp"

#include <toml.hpp>

#include <memory>
#include <string>
#include <vector>

namespace credchain {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        CredchainConfig config;

        static LoadResult ok(CredchainConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file (honours `include = [...]`)
     * @param config_path Path to credchain.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from a TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check a config; empty result means valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const CredchainConfig& config);

private:
    static StsConfig extract_sts(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static CredentialSourcesConfig extract_credential_sources(const toml::table& root);
    static CredchainConfig extract_all_sections(const toml::table& tbl);
    static LoadResult validate_and_return(CredchainConfig config);
};

/**
 * @brief Apply the [logging] section to the process-wide logger
 * @return false if the level name is not recognised (level left unchanged)
 */
bool apply_logging_config(const LoggingConfig& config);

/**
 * @brief Client configuration for hops and federated providers from [sts]
 */
[[nodiscard]] sts::ClientConfiguration make_client_configuration(
    const StsConfig& config, std::shared_ptr<sts::IStsClient> client);

/**
 * @brief Named-source registry from [credential_sources]
 *
 * Registers each enabled builtin; `extra` providers are added as-is and win
 * over builtins of the same name.
 */
[[nodiscard]] Result<NamedProviderRegistry> make_registry(
    const CredchainConfig& config, NamedProviderRegistry::ProviderMap extra = {});

} // namespace credchain
