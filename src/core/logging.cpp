#include "toolgov/core/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace toolgov::core {

fs::path log_file_path(const ObservabilityConfig& observability) {
    return observability.log_path / std::string(kLogFileName);
}

Result<void, Error> configure_logging(const ObservabilityConfig& observability) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    auto file = log_file_path(observability);
    auto status = Result<void, Error>::ok();
    try {
        fs::create_directories(observability.log_path);
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file.string()));
    } catch (const fs::filesystem_error& e) {
        status = Result<void, Error>::err(ErrorCode::FileWriteFailed, e.what(), file.string());
    } catch (const spdlog::spdlog_ex& e) {
        status = Result<void, Error>::err(ErrorCode::FileWriteFailed, e.what(), file.string());
    }

    auto logger = std::make_shared<spdlog::logger>(std::string(kLoggerName), sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(observability.log_level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    return status;
}

}  // namespace toolgov::core
