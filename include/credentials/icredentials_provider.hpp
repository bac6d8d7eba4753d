#pragma once

#include "credentials/credentials.hpp"

#include <future>
#include <stop_token>
#include <string>

namespace credchain {

/**
 * @brief Interface for anything that can supply credentials
 *
 * Base providers of a chain (static keys, named sources, web identity
 * tokens) implement this. Providers are shared between chains, so
 * implementations must be safe to call concurrently.
 */
class ICredentialsProvider {
public:
    virtual ~ICredentialsProvider() = default;

    /**
     * @brief Start loading credentials
     * @param stop Forwarded to any remote call the provider makes; once stop
     *        is requested the provider resolves to CANCELLED.
     * @return Future resolving to the credentials or a typed error.
     *         The future may be deferred; callers must not rely on wait_for().
     */
    [[nodiscard]] virtual std::future<CredentialsResult> provide_credentials(std::stop_token stop) const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief Already-resolved future, for providers that never suspend
 */
[[nodiscard]] inline std::future<CredentialsResult> make_ready_credentials(CredentialsResult result) {
    std::promise<CredentialsResult> promise;
    promise.set_value(std::move(result));
    return promise.get_future();
}

} // namespace credchain
