#include "chain/chain_builder.hpp"
#include "core/utils.hpp"
#include "credentials/static_credentials_provider.hpp"
#include "credentials/web_identity_token_provider.hpp"

#include <format>

namespace credchain {

using BaseResult = Result<std::shared_ptr<const ICredentialsProvider>>;

ChainBuilder::ChainBuilder(sts::ClientConfiguration client_config)
    : client_config_(std::move(client_config)) {}

BaseResult ChainBuilder::resolve_base(const NamedProviderRegistry& registry,
                                      const BaseProviderSpec& base) const {
    if (const auto* named = std::get_if<NamedSource>(&base)) {
        auto provider = registry.lookup(named->name);
        if (!provider) {
            Error e;
            e.category = ErrorCategory::UNKNOWN_PROVIDER;
            e.message = std::format(
                "profile referenced `{}` provider but that provider is not supported",
                named->name);
            e.source = named->name;
            return BaseResult::error(std::move(e));
        }
        return BaseResult::ok(std::move(provider));
    }

    if (const auto* keys = std::get_if<StaticKeyPair>(&base)) {
        return BaseResult::ok(std::make_shared<const StaticCredentialsProvider>(
            keys->access_key_id, keys->secret_access_key, keys->session_token));
    }

    const auto& federated = std::get<FederatedTokenRole>(base);
    WebIdentityTokenRole role;
    role.web_identity_token_file = federated.web_identity_token_file;
    role.role_arn = federated.role_arn;
    if (federated.session_name) {
        role.session_name = *federated.session_name;
    } else if (client_config_.session_name_generator) {
        role.session_name = client_config_.session_name_generator(sts::kWebIdentityPurpose);
    } else {
        role.session_name = sts::default_session_name(sts::kWebIdentityPurpose);
    }
    return BaseResult::ok(std::make_shared<const WebIdentityTokenProvider>(
        std::move(role), client_config_));
}

Result<ProviderChain> ChainBuilder::build(const NamedProviderRegistry& registry,
                                          const ProfileChain& profile_chain) const {
    auto base = resolve_base(registry, profile_chain.base);
    if (base.is_error()) {
        return Result<ProviderChain>::error(base.error());
    }
    utils::log::info(std::format("first credentials will be loaded from {}",
        describe(profile_chain.base)));

    std::vector<AssumeRoleHop> hops;
    hops.reserve(profile_chain.hops.size());
    for (const auto& hop : profile_chain.hops) {
        utils::log::info(std::format("which will be used to assume a role: {}", describe(hop)));
        hops.emplace_back(hop.role_arn, hop.external_id, hop.session_name);
    }

    return Result<ProviderChain>::ok(ProviderChain(std::move(base.value()), std::move(hops)));
}

} // namespace credchain
