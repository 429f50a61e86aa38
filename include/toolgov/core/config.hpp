#pragma once

#include "errors.hpp"
#include "result.hpp"
#include "types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace toolgov::core {

namespace fs = std::filesystem;

// Governance mode used when a caller does not pick one per batch
struct GovernanceConfig {
    GovernanceMode mode = GovernanceMode::SmartApprove;
};

// How the manager fans out to its inspectors
struct InspectionConfig {
    bool parallel = true;
    int thread_pool_size = 4;
};

// Repetition inspector settings
struct RepetitionConfig {
    bool enabled = true;
    std::optional<uint32_t> max_repetitions;  // unset -> RepetitionInspector default
};

// Permission inspector and standing-policy store
struct PermissionsConfig {
    std::vector<std::string> readonly_tools;
    std::vector<std::string> regular_tools;
    fs::path store_path = "~/.toolgov/permissions.yaml";
};

// Observability configuration
struct ObservabilityConfig {
    std::string log_level = "info";  // trace, debug, info, warn, error
    fs::path log_path = "~/.toolgov/logs";
};

// Main configuration
struct Config {
    GovernanceConfig governance;
    InspectionConfig inspection;
    RepetitionConfig repetition;
    PermissionsConfig permissions;
    ObservabilityConfig observability;

    // Load configuration from file
    static Result<Config, Error> load(const fs::path& path);

    // Load with defaults, falling back if file doesn't exist
    static Config load_or_default(const fs::path& path);

    // Save configuration to file
    Result<void, Error> save(const fs::path& path) const;

    // Get default config path
    static fs::path default_path();

    // Expand environment variables in paths
    void expand_paths();

    // Apply TOOLGOV_* environment overrides
    void apply_env_overrides();

    // Validate configuration
    Result<void, Error> validate() const;
};

// Helper to expand ~ and environment variables in paths
std::string expand_path(const std::string& path);
fs::path expand_path(const fs::path& path);

}  // namespace toolgov::core
