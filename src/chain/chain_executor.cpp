#include "chain/chain_executor.hpp"
#include "core/await.hpp"
#include "core/utils.hpp"

#include <format>

namespace credchain {

ChainExecutor::ChainExecutor(sts::ClientConfiguration client_config)
    : client_config_(std::move(client_config)) {}

CredentialsResult ChainExecutor::load_base(const ProviderChain& chain,
                                           const std::stop_token& stop) const {
    const auto& base = chain.base();
    auto future = base.provide_credentials(stop);
    auto result = await_result(future, stop, client_config_.poll_interval);
    if (result.is_ok() || result.error_category() == ErrorCategory::CANCELLED) {
        return result;
    }
    return CredentialsResult::error(Error::wrap(
        result.error_category(),
        std::format("base provider {} failed", base.name()),
        base.name(),
        result.error()));
}

CredentialsResult ChainExecutor::execute(const ProviderChain& chain, std::stop_token stop) const {
    const utils::Timer timer;
    const auto hops = chain.hops();

    auto current = load_base(chain, stop);
    if (current.is_error()) {
        utils::log::warn(std::format("credential chain failed: {}", current.error().to_string()));
        return current;
    }
    utils::log::debug(std::format("loaded base credentials: {}", current.value().redacted()));

    for (size_t i = 0; i < hops.size(); ++i) {
        const auto& hop = hops[i];
        if (stop.stop_requested()) {
            return CredentialsResult::error(ErrorCategory::CANCELLED,
                std::format("credential chain cancelled before hop {} of {}", i + 1, hops.size()));
        }

        auto next = hop.credentials(current.value(), client_config_, stop);
        if (next.is_error()) {
            const auto category = next.error_category();
            const auto message = category == ErrorCategory::CANCELLED
                ? std::format("credential chain cancelled during hop {} of {} (role {})",
                      i + 1, hops.size(), hop.role_arn())
                : std::format("hop {} of {} (role {}) failed", i + 1, hops.size(), hop.role_arn());
            auto error = Error::wrap(category, message, AssumeRoleHop::kProviderName, next.error());
            utils::log::warn(std::format("credential chain failed: {}", error.to_string()));
            return CredentialsResult::error(std::move(error));
        }

        // The previous credentials are dropped: hop i+1 only ever sees hop i's output
        current = std::move(next);
    }

    utils::log::debug(std::format("credential chain resolved through {} hop(s) in {}ms",
        hops.size(), timer.elapsed_ms().count()));
    return current;
}

} // namespace credchain
