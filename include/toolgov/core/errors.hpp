#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace toolgov::core {

// Error codes organized by category
enum class ErrorCode {
    // General errors (1-99)
    Unknown = 1,
    InvalidArgument = 2,
    AlreadyExists = 4,

    // Inspection errors (300-399)
    InspectorFailed = 300,
    InspectorPoolStopped = 303,

    // Permission store errors (400-499)
    PermissionStoreLoadFailed = 400,
    PermissionStoreSaveFailed = 401,
    PermissionStoreCorrupted = 402,
    UnknownPermission = 403,

    // Configuration errors (600-699)
    ConfigNotFound = 600,
    ConfigParseFailed = 601,
    ConfigValidationFailed = 602,

    // File system errors (700-799)
    FileNotFound = 700,
    FileReadFailed = 701,
    FileWriteFailed = 702,
};

inline std::string_view error_code_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::AlreadyExists: return "Already exists";

        case ErrorCode::InspectorFailed: return "Tool inspector failed";
        case ErrorCode::InspectorPoolStopped: return "Inspector thread pool is stopped";

        case ErrorCode::PermissionStoreLoadFailed: return "Failed to load permission store";
        case ErrorCode::PermissionStoreSaveFailed: return "Failed to save permission store";
        case ErrorCode::PermissionStoreCorrupted: return "Permission store data corrupted";
        case ErrorCode::UnknownPermission: return "Unknown permission value";

        case ErrorCode::ConfigNotFound: return "Configuration file not found";
        case ErrorCode::ConfigParseFailed: return "Failed to parse configuration";
        case ErrorCode::ConfigValidationFailed: return "Configuration validation failed";

        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileReadFailed: return "Failed to read file";
        case ErrorCode::FileWriteFailed: return "Failed to write file";
    }
    return "Unknown error code";
}

// Error with optional context (inspector name, file path, offending value)
struct Error {
    ErrorCode code;
    std::string message;
    std::optional<std::string> context;

    Error() : code(ErrorCode::Unknown) {}

    Error(ErrorCode c) : code(c), message(std::string(error_code_message(c))) {}

    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    std::string full_message() const {
        std::string result = message;
        if (context) {
            result += " [" + *context + "]";
        }
        return result;
    }

    // For logging
    std::string to_string() const {
        return "[" + std::to_string(static_cast<int>(code)) + "] " + full_message();
    }
};

}  // namespace toolgov::core
