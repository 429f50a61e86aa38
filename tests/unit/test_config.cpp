#include <catch2/catch_test_macros.hpp>
#include "toolgov/core/config.hpp"

#include <cstdlib>
#include <fstream>

using namespace toolgov::core;

namespace {

fs::path write_temp_config(const std::string& name, const std::string& yaml) {
    auto path = fs::temp_directory_path() / name;
    std::ofstream(path) << yaml;
    return path;
}

}  // namespace

TEST_CASE("Default config values", "[config]") {
    Config config;

    REQUIRE(config.governance.mode == GovernanceMode::SmartApprove);
    REQUIRE(config.inspection.parallel);
    REQUIRE(config.inspection.thread_pool_size == 4);
    REQUIRE(config.repetition.enabled);
    REQUIRE_FALSE(config.repetition.max_repetitions.has_value());
    REQUIRE(config.observability.log_level == "info");
    REQUIRE(config.validate().is_ok());
}

TEST_CASE("Config loads from YAML", "[config]") {
    auto path = write_temp_config("toolgov_test_config.yaml", R"(
governance:
  mode: approve
inspection:
  parallel: false
  thread_pool_size: 2
repetition:
  enabled: true
  max_repetitions: 3
permissions:
  readonly_tools: [developer__read_file, developer__list_dir]
  regular_tools: [todo__write]
  store_path: /tmp/toolgov_permissions.yaml
observability:
  log_level: debug
)");

    auto result = Config::load(path);
    REQUIRE(result.is_ok());

    const auto& config = result.value();
    REQUIRE(config.governance.mode == GovernanceMode::Approve);
    REQUIRE_FALSE(config.inspection.parallel);
    REQUIRE(config.inspection.thread_pool_size == 2);
    REQUIRE(config.repetition.max_repetitions == 3u);
    REQUIRE(config.permissions.readonly_tools.size() == 2);
    REQUIRE(config.permissions.regular_tools.front() == "todo__write");
    REQUIRE(config.permissions.store_path == fs::path("/tmp/toolgov_permissions.yaml"));
    REQUIRE(config.observability.log_level == "debug");

    fs::remove(path);
}

TEST_CASE("Config rejects an unknown governance mode", "[config]") {
    auto path = write_temp_config("toolgov_test_bad_mode.yaml", "governance:\n  mode: yolo\n");

    auto result = Config::load(path);
    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::ConfigValidationFailed);

    fs::remove(path);
}

TEST_CASE("Config rejects a non-positive repetition limit", "[config]") {
    auto path = write_temp_config("toolgov_test_bad_reps.yaml", "repetition:\n  max_repetitions: 0\n");

    auto result = Config::load(path);
    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::ConfigValidationFailed);

    fs::remove(path);
}

TEST_CASE("Missing config file", "[config]") {
    auto path = fs::temp_directory_path() / "toolgov_does_not_exist.yaml";

    auto result = Config::load(path);
    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::ConfigNotFound);

    auto config = Config::load_or_default(path);
    REQUIRE(config.inspection.thread_pool_size == 4);
}

TEST_CASE("Config validation", "[config]") {
    Config config;

    config.inspection.thread_pool_size = 0;
    REQUIRE(config.validate().is_err());

    config.inspection.thread_pool_size = 1;
    config.observability.log_level = "loud";
    REQUIRE(config.validate().is_err());
}

TEST_CASE("Config save and reload", "[config]") {
    auto path = fs::temp_directory_path() / "toolgov_test_saved.yaml";

    Config config;
    config.governance.mode = GovernanceMode::Chat;
    config.repetition.max_repetitions = 9;
    config.permissions.readonly_tools = {"developer__read_file"};
    config.permissions.store_path = "/tmp/toolgov_saved_permissions.yaml";
    REQUIRE(config.save(path).is_ok());

    auto loaded = Config::load(path);
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().governance.mode == GovernanceMode::Chat);
    REQUIRE(loaded.value().repetition.max_repetitions == 9u);
    REQUIRE(loaded.value().permissions.readonly_tools == std::vector<std::string>{"developer__read_file"});

    fs::remove(path);
}

TEST_CASE("Environment overrides", "[config]") {
    ::setenv("TOOLGOV_MODE", "auto", 1);
    ::setenv("TOOLGOV_MAX_REPETITIONS", "12", 1);

    Config config;
    config.apply_env_overrides();

    ::unsetenv("TOOLGOV_MODE");
    ::unsetenv("TOOLGOV_MAX_REPETITIONS");

    REQUIRE(config.governance.mode == GovernanceMode::Auto);
    REQUIRE(config.repetition.max_repetitions == 12u);
}

TEST_CASE("Path expansion", "[config]") {
    ::setenv("TOOLGOV_TEST_DIR", "/var/toolgov", 1);
    REQUIRE(expand_path(std::string("${TOOLGOV_TEST_DIR}/store.yaml")) == "/var/toolgov/store.yaml");
    ::unsetenv("TOOLGOV_TEST_DIR");
}
