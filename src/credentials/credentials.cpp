#include "credentials/credentials.hpp"
#include "core/utils.hpp"

#include <format>

namespace credchain {

std::string Credentials::redacted() const {
    return std::format("Credentials {{ provider_name: \"{}\", access_key_id: \"{}\", "
                       "secret_access_key: \"** redacted **\", session_token: \"{}\", "
                       "expiration: {} }}",
        provider_name,
        access_key_id,
        session_token ? "** redacted **" : "",
        expiration ? utils::format_timestamp(*expiration) : "never");
}

} // namespace credchain
