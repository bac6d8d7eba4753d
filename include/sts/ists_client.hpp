#pragma once

#include "sts/sts_types.hpp"

#include <future>
#include <stop_token>

namespace credchain::sts {

/**
 * @brief Remote identity-delegation service (transport + service)
 *
 * Implementations issue exactly one round trip per call and never retry.
 * Failures are reported as TRANSPORT_ERROR (connection, timeout, I/O) or
 * SERVICE_ERROR (the service rejected the request). The stop token is a hint:
 * an implementation may abandon the request when stop is requested.
 */
class IStsClient {
public:
    virtual ~IStsClient() = default;

    [[nodiscard]] virtual std::future<AssumeRoleResult> assume_role(
        const AssumeRoleRequest& request,
        const StsCallConfig& config,
        std::stop_token stop) = 0;

    [[nodiscard]] virtual std::future<AssumeRoleResult> assume_role_with_web_identity(
        const AssumeRoleWithWebIdentityRequest& request,
        const StsCallConfig& config,
        std::stop_token stop) = 0;
};

} // namespace credchain::sts
