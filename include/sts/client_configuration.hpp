#pragma once

#include "sts/ists_client.hpp"
#include "sts/sts_util.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace credchain::sts {

/**
 * @brief Everything a hop or federated provider needs to reach the service
 *
 * Built once by the caller and passed through opaquely. Copies share the
 * same client.
 */
struct ClientConfiguration {
    std::shared_ptr<IStsClient> client;
    std::optional<std::string> region;
    SessionNameGenerator session_name_generator = default_session_name;

    // How often an in-flight call re-checks for cancellation
    std::chrono::milliseconds poll_interval{10};
};

} // namespace credchain::sts
