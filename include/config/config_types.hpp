#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace credchain {

// ============================================================================
// Configuration Types
// ============================================================================

struct StsConfig {
    std::optional<std::string> region;
    std::chrono::milliseconds poll_interval{10};   // Cancellation check while a call is in flight
};

struct LoggingConfig {
    std::string level = "info";
};

struct CredentialSourcesConfig {
    std::vector<std::string> enabled{"Environment"};   // Builtin named sources to register
};

struct CredchainConfig {
    StsConfig sts;
    LoggingConfig logging;
    CredentialSourcesConfig credential_sources;
};

} // namespace credchain
