#include <catch2/catch_test_macros.hpp>
#include "toolgov/core/logging.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <string>

using namespace toolgov::core;

TEST_CASE("Log lines reach the configured log file", "[logging]") {
    auto previous = spdlog::default_logger();
    auto dir = fs::temp_directory_path() / "toolgov_test_logs";
    fs::remove_all(dir);

    ObservabilityConfig observability;
    observability.log_level = "debug";
    observability.log_path = dir;

    auto result = configure_logging(observability);
    REQUIRE(result.is_ok());

    spdlog::info("repetition limit marker 42");
    spdlog::default_logger()->flush();

    std::ifstream file(log_file_path(observability));
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    REQUIRE(text.find("repetition limit marker 42") != std::string::npos);
    REQUIRE(spdlog::default_logger()->level() == spdlog::level::debug);

    spdlog::set_default_logger(previous);
    fs::remove_all(dir);
}

TEST_CASE("Unusable log directory falls back to stderr", "[logging]") {
    auto previous = spdlog::default_logger();
    auto blocker = fs::temp_directory_path() / "toolgov_test_log_blocker";
    fs::remove_all(blocker);
    std::ofstream(blocker) << "not a directory";

    ObservabilityConfig observability;
    observability.log_path = blocker / "logs";

    auto result = configure_logging(observability);
    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::FileWriteFailed);
    REQUIRE(spdlog::default_logger() != nullptr);
    REQUIRE(spdlog::default_logger()->sinks().size() == 1);

    spdlog::set_default_logger(previous);
    fs::remove_all(blocker);
}
