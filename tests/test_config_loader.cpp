#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "mocks/mock_credentials_provider.hpp"
#include "mocks/mock_sts_client.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace credchain;

TEST_CASE("ConfigLoader: defaults for an empty document", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    CHECK_FALSE(result.config.sts.region.has_value());
    CHECK(result.config.sts.poll_interval == std::chrono::milliseconds(10));
    CHECK(result.config.logging.level == "info");
    CHECK(result.config.credential_sources.enabled == std::vector<std::string>{"Environment"});
}

TEST_CASE("ConfigLoader: parses all sections", "[config]") {
    std::string toml = R"(
[sts]
region = "eu-central-1"
poll_interval_ms = 25

[logging]
level = "debug"

[credential_sources]
enabled = []
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.sts.region == "eu-central-1");
    CHECK(result.config.sts.poll_interval == std::chrono::milliseconds(25));
    CHECK(result.config.logging.level == "debug");
    CHECK(result.config.credential_sources.enabled.empty());
}

TEST_CASE("ConfigLoader: environment expansion", "[config]") {
    setenv("CREDCHAIN_TEST_REGION", "ap-southeast-2", 1);
    auto result = ConfigLoader::load_from_string(R"(
[sts]
region = "${CREDCHAIN_TEST_REGION}"
)");
    REQUIRE(result.success);
    CHECK(result.config.sts.region == "ap-southeast-2");
    unsetenv("CREDCHAIN_TEST_REGION");
}

TEST_CASE("ConfigLoader: validation collects every error", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[sts]
poll_interval_ms = 0

[logging]
level = "verbose"

[credential_sources]
enabled = ["Environment", "Ec2InstanceMetadata"]
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.starts_with("Config validation failed:"));
    CHECK(result.error_message.find("sts.poll_interval_ms") != std::string::npos);
    CHECK(result.error_message.find("logging.level") != std::string::npos);
    CHECK(result.error_message.find("Ec2InstanceMetadata") != std::string::npos);
}

TEST_CASE("ConfigLoader: malformed TOML", "[config]") {
    auto result = ConfigLoader::load_from_string("[sts\nregion = ");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to parse config:"));
}

TEST_CASE("ConfigLoader: file with include", "[config]") {
    namespace fs = std::filesystem;
    const auto dir = fs::temp_directory_path() / "credchain_config_test";
    fs::create_directories(dir);
    {
        std::ofstream base(dir / "base.toml");
        base << "[sts]\nregion = \"us-east-2\"\npoll_interval_ms = 50\n";
        std::ofstream top(dir / "credchain.toml");
        top << "include = \"base.toml\"\n[sts]\npoll_interval_ms = 5\n";
    }

    auto result = ConfigLoader::load_from_file((dir / "credchain.toml").string());
    REQUIRE(result.success);
    CHECK(result.config.sts.region == "us-east-2");
    CHECK(result.config.sts.poll_interval == std::chrono::milliseconds(5));

    fs::remove_all(dir);
}

TEST_CASE("ConfigLoader: missing file", "[config]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/credchain.toml");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to load config:"));
}

TEST_CASE("apply_logging_config: sets the process log level", "[config]") {
    const auto saved = utils::log::level();

    LoggingConfig cfg;
    cfg.level = "WARN";
    CHECK(apply_logging_config(cfg));
    CHECK(utils::log::level() == utils::log::Level::WARN);

    cfg.level = "loud";
    CHECK_FALSE(apply_logging_config(cfg));
    CHECK(utils::log::level() == utils::log::Level::WARN);

    utils::log::set_level(saved);
}

TEST_CASE("make_client_configuration: wires region and client", "[config]") {
    StsConfig sts_cfg;
    sts_cfg.region = "us-east-1";
    sts_cfg.poll_interval = std::chrono::milliseconds(3);
    auto client = std::make_shared<testing::MockStsClient>();

    auto client_config = make_client_configuration(sts_cfg, client);

    CHECK(client_config.client.get() == client.get());
    CHECK(client_config.region == "us-east-1");
    CHECK(client_config.poll_interval == std::chrono::milliseconds(3));
    REQUIRE(client_config.session_name_generator);
    CHECK(client_config.session_name_generator(sts::kAssumeRolePurpose).starts_with("assume-role-from-profile-"));
}

TEST_CASE("make_registry: enabled sources from a loaded config", "[config]") {
    auto loaded = ConfigLoader::load_from_string(R"(
[credential_sources]
enabled = ["Environment"]
)");
    REQUIRE(loaded.success);

    auto corp = std::make_shared<const testing::MockCredentialsProvider>(
        CredentialsResult::error(ErrorCategory::CREDENTIALS_NOT_LOADED, "unused"), "Corp");
    auto result = make_registry(loaded.config, {{"Corp", corp}});

    REQUIRE(result.is_ok());
    CHECK(result.value().names() == std::vector<std::string>{"Corp", "Environment"});
    CHECK(result.value().lookup("Corp") == corp);
}

TEST_CASE("make_registry: no enabled sources gives an empty registry", "[config]") {
    CredchainConfig config;
    config.credential_sources.enabled.clear();

    auto result = make_registry(config);

    REQUIRE(result.is_ok());
    CHECK(result.value().size() == 0);
}
