#include <catch2/catch_test_macros.hpp>
#include "chain/assume_role_hop.hpp"
#include "mocks/mock_sts_client.hpp"

using namespace credchain;
using namespace credchain::testing;

namespace {

sts::ClientConfiguration make_config(std::shared_ptr<MockStsClient> client) {
    sts::ClientConfiguration config;
    config.client = std::move(client);
    config.region = "eu-west-1";
    config.session_name_generator = [](std::string_view purpose) {
        return std::string(purpose) + "-fixed";
    };
    return config;
}

Credentials caller() {
    return Credentials("AKIACALLER", "caller-secret", std::nullopt, std::nullopt, "Static");
}

} // anonymous namespace

TEST_CASE("AssumeRoleHop: one call with caller identity and region", "[chain][hop]") {
    auto client = std::make_shared<MockStsClient>();
    AssumeRoleHop hop("arn:aws:iam::111111111111:role/A");

    auto result = hop.credentials(caller(), make_config(client));

    REQUIRE(result.is_ok());
    const auto calls = client->assume_role_calls();
    REQUIRE(calls.size() == 1);
    CHECK(calls[0].request.role_arn == "arn:aws:iam::111111111111:role/A");
    CHECK_FALSE(calls[0].request.external_id.has_value());
    REQUIRE(calls[0].config.caller.has_value());
    CHECK(*calls[0].config.caller == caller());
    CHECK(calls[0].config.region == "eu-west-1");
}

TEST_CASE("AssumeRoleHop: output is attributed to the hop", "[chain][hop]") {
    auto client = std::make_shared<MockStsClient>();
    AssumeRoleHop hop("arn:aws:iam::111111111111:role/A");

    auto result = hop.credentials(caller(), make_config(client));

    REQUIRE(result.is_ok());
    const auto& creds = result.value();
    CHECK(creds.access_key_id == "ASIA:arn:aws:iam::111111111111:role/A");
    CHECK(creds.secret_access_key == "secret:arn:aws:iam::111111111111:role/A");
    CHECK(creds.session_token == "token:arn:aws:iam::111111111111:role/A");
    CHECK(creds.expiration == kTestExpiration);
    CHECK(creds.provider_name == AssumeRoleHop::kProviderName);
}

TEST_CASE("AssumeRoleHop: missing session name uses the chain-hop purpose", "[chain][hop]") {
    auto client = std::make_shared<MockStsClient>();
    AssumeRoleHop hop("arn:aws:iam::111111111111:role/A");

    REQUIRE(hop.credentials(caller(), make_config(client)).is_ok());

    const auto calls = client->assume_role_calls();
    REQUIRE(calls.size() == 1);
    CHECK(calls[0].request.role_session_name == "assume-role-from-profile-fixed");
    CHECK(calls[0].request.role_session_name.find("web-identity-token-profile") == std::string::npos);
}

TEST_CASE("AssumeRoleHop: default generator output is non-empty and tagged", "[chain][hop]") {
    auto client = std::make_shared<MockStsClient>();
    auto config = make_config(client);
    config.session_name_generator = sts::default_session_name;
    AssumeRoleHop hop("arn:aws:iam::111111111111:role/A");

    REQUIRE(hop.credentials(caller(), config).is_ok());

    const auto name = client->assume_role_calls().at(0).request.role_session_name;
    CHECK(name.starts_with("assume-role-from-profile-"));
    CHECK(name.size() > std::string("assume-role-from-profile-").size());
}

TEST_CASE("AssumeRoleHop: explicit session name and external id are sent", "[chain][hop]") {
    auto client = std::make_shared<MockStsClient>();
    AssumeRoleHop hop("arn:aws:iam::111111111111:role/A", "eid", "audit-session");

    REQUIRE(hop.credentials(caller(), make_config(client)).is_ok());

    const auto calls = client->assume_role_calls();
    REQUIRE(calls.size() == 1);
    CHECK(calls[0].request.role_session_name == "audit-session");
    CHECK(calls[0].request.external_id == "eid");
}

TEST_CASE("AssumeRoleHop: service failure is wrapped with its cause", "[chain][hop]") {
    auto client = std::make_shared<MockStsClient>();
    client->set_assume_role_handler([](const sts::AssumeRoleRequest&, const sts::StsCallConfig&) {
        return MockStsClient::fail(ErrorCategory::SERVICE_ERROR, "AccessDenied: not authorized");
    });
    AssumeRoleHop hop("arn:aws:iam::111111111111:role/A");

    auto result = hop.credentials(caller(), make_config(client));

    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::PROVIDER_ERROR);
    CHECK(result.error().source == AssumeRoleHop::kProviderName);
    CHECK(result.error_message().find("arn:aws:iam::111111111111:role/A") != std::string::npos);
    REQUIRE(result.error().cause != nullptr);
    CHECK(result.error().cause->category == ErrorCategory::SERVICE_ERROR);
    CHECK(result.error().cause->message == "AccessDenied: not authorized");
    // Never retried
    CHECK(client->assume_role_calls().size() == 1);
}

TEST_CASE("AssumeRoleHop: response without credentials is unhandled", "[chain][hop]") {
    auto client = std::make_shared<MockStsClient>();
    client->set_assume_role_handler([](const sts::AssumeRoleRequest&, const sts::StsCallConfig&) {
        return sts::AssumeRoleResult::ok(sts::AssumeRoleResponse{});
    });
    AssumeRoleHop hop("arn:aws:iam::111111111111:role/A");

    auto result = hop.credentials(caller(), make_config(client));

    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::UNHANDLED);
    CHECK(result.error_message() == "STS credentials must be defined");
}

TEST_CASE("AssumeRoleHop: no client configured", "[chain][hop]") {
    sts::ClientConfiguration config;
    AssumeRoleHop hop("arn:aws:iam::111111111111:role/A");

    auto result = hop.credentials(caller(), config);

    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::PROVIDER_ERROR);
}

TEST_CASE("AssumeRoleHop: already-stopped token issues no call", "[chain][hop]") {
    auto client = std::make_shared<MockStsClient>();
    std::stop_source source;
    source.request_stop();
    AssumeRoleHop hop("arn:aws:iam::111111111111:role/A");

    auto result = hop.credentials(caller(), make_config(client), source.get_token());

    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CANCELLED);
    CHECK(client->total_calls() == 0);
}
