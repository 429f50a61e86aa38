#pragma once

#include "config.hpp"
#include "result.hpp"

namespace toolgov::core {

inline constexpr std::string_view kLoggerName = "toolgov";
inline constexpr std::string_view kLogFileName = "toolgov.log";

// <log_path>/toolgov.log
fs::path log_file_path(const ObservabilityConfig& observability);

// Install the default spdlog logger: a stderr sink, plus a file sink under
// log_path. The stderr-only logger is still installed when the file sink
// cannot be opened; the error says why.
Result<void, Error> configure_logging(const ObservabilityConfig& observability);

}  // namespace toolgov::core
