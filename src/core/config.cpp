#include "toolgov/core/config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <regex>

namespace toolgov::core {

namespace {

fs::path expand_path_fs(const fs::path& path) {
    return fs::path(expand_path(path.string()));
}

std::vector<std::string> read_string_list(const YAML::Node& node) {
    std::vector<std::string> values;
    for (const auto& item : node) {
        values.push_back(item.as<std::string>());
    }
    return values;
}

Result<uint32_t, Error> parse_max_repetitions(const std::string& text) {
    try {
        size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed != text.size() || value < 1 || value > UINT32_MAX) {
            return Result<uint32_t, Error>::err(
                ErrorCode::ConfigValidationFailed,
                "repetition.max_repetitions must be a positive integer",
                text
            );
        }
        return Result<uint32_t, Error>::ok(static_cast<uint32_t>(value));
    } catch (const std::exception&) {
        return Result<uint32_t, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "repetition.max_repetitions must be a positive integer",
            text
        );
    }
}

}  // namespace

std::string expand_path(const std::string& path) {
    std::string result = path;

    // Expand ~
    if (!result.empty() && result[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            result = std::string(home) + result.substr(1);
        }
    }

    // Expand ${VAR} patterns
    std::regex env_regex(R"(\$\{([^}]+)\})");
    std::smatch match;
    while (std::regex_search(result, match, env_regex)) {
        std::string var_name = match[1].str();
        const char* var_value = std::getenv(var_name.c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    return result;
}

fs::path expand_path(const fs::path& path) {
    return expand_path_fs(path);
}

fs::path Config::default_path() {
    return fs::path(expand_path(std::string("~/.toolgov/config.yaml")));
}

void Config::expand_paths() {
    permissions.store_path = expand_path_fs(permissions.store_path);
    observability.log_path = expand_path_fs(observability.log_path);
}

void Config::apply_env_overrides() {
    if (const char* mode = std::getenv("TOOLGOV_MODE")) {
        if (auto parsed = governance_mode_from_string(mode)) {
            governance.mode = *parsed;
        }
    }
    if (const char* max_reps = std::getenv("TOOLGOV_MAX_REPETITIONS")) {
        auto parsed = parse_max_repetitions(max_reps);
        if (parsed.is_ok()) {
            repetition.max_repetitions = parsed.value();
        }
    }
}

Result<void, Error> Config::validate() const {
    if (inspection.thread_pool_size < 1) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "inspection.thread_pool_size must be at least 1"
        );
    }

    if (repetition.max_repetitions && *repetition.max_repetitions < 1) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "repetition.max_repetitions must be at least 1"
        );
    }

    static const std::vector<std::string> levels = {
        "trace", "debug", "info", "warn", "warning", "error", "critical", "off"
    };
    if (std::find(levels.begin(), levels.end(), observability.log_level) == levels.end()) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "Unknown observability.log_level",
            observability.log_level
        );
    }

    return Result<void, Error>::ok();
}

Result<Config, Error> Config::load(const fs::path& path) {
    fs::path expanded = expand_path_fs(path);

    if (!fs::exists(expanded)) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigNotFound,
            "Configuration file not found",
            expanded.string()
        );
    }

    try {
        YAML::Node root = YAML::LoadFile(expanded.string());
        Config config;

        // Parse governance config
        if (auto gov_node = root["governance"]) {
            std::string mode = gov_node["mode"].as<std::string>(
                std::string(governance_mode_to_string(config.governance.mode)));
            auto parsed = governance_mode_from_string(mode);
            if (!parsed) {
                return Result<Config, Error>::err(
                    ErrorCode::ConfigValidationFailed,
                    "Unknown governance.mode: " + mode,
                    expanded.string()
                );
            }
            config.governance.mode = *parsed;
        }

        // Parse inspection config
        if (auto insp_node = root["inspection"]) {
            config.inspection.parallel = insp_node["parallel"].as<bool>(config.inspection.parallel);
            config.inspection.thread_pool_size = insp_node["thread_pool_size"].as<int>(config.inspection.thread_pool_size);
        }

        // Parse repetition config
        if (auto rep_node = root["repetition"]) {
            config.repetition.enabled = rep_node["enabled"].as<bool>(config.repetition.enabled);
            if (auto max_node = rep_node["max_repetitions"]; max_node && !max_node.IsNull()) {
                auto parsed = parse_max_repetitions(max_node.as<std::string>());
                if (parsed.is_err()) {
                    return Result<Config, Error>::err(std::move(parsed).error());
                }
                config.repetition.max_repetitions = parsed.value();
            }
        }

        // Parse permissions config
        if (auto perm_node = root["permissions"]) {
            if (auto ro_node = perm_node["readonly_tools"]) {
                config.permissions.readonly_tools = read_string_list(ro_node);
            }
            if (auto reg_node = perm_node["regular_tools"]) {
                config.permissions.regular_tools = read_string_list(reg_node);
            }
            config.permissions.store_path = perm_node["store_path"].as<std::string>(
                config.permissions.store_path.string());
        }

        // Parse observability config
        if (auto obs_node = root["observability"]) {
            config.observability.log_level = obs_node["log_level"].as<std::string>(config.observability.log_level);
            config.observability.log_path = obs_node["log_path"].as<std::string>(config.observability.log_path.string());
        }

        config.apply_env_overrides();
        config.expand_paths();

        auto validation = config.validate();
        if (validation.is_err()) {
            return Result<Config, Error>::err(std::move(validation).error());
        }

        return Result<Config, Error>::ok(std::move(config));

    } catch (const YAML::Exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            std::string("YAML parse error: ") + e.what(),
            expanded.string()
        );
    } catch (const std::exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            e.what(),
            expanded.string()
        );
    }
}

Config Config::load_or_default(const fs::path& path) {
    auto result = load(path);
    if (result.is_ok()) {
        return std::move(result).value();
    }

    Config config;
    config.apply_env_overrides();
    config.expand_paths();
    return config;
}

Result<void, Error> Config::save(const fs::path& path) const {
    try {
        fs::path expanded = expand_path_fs(path);

        if (expanded.has_parent_path()) {
            fs::create_directories(expanded.parent_path());
        }

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "governance" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "mode" << YAML::Value << std::string(governance_mode_to_string(governance.mode));
        out << YAML::EndMap;

        out << YAML::Key << "inspection" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "parallel" << YAML::Value << inspection.parallel;
        out << YAML::Key << "thread_pool_size" << YAML::Value << inspection.thread_pool_size;
        out << YAML::EndMap;

        out << YAML::Key << "repetition" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "enabled" << YAML::Value << repetition.enabled;
        if (repetition.max_repetitions) {
            out << YAML::Key << "max_repetitions" << YAML::Value << *repetition.max_repetitions;
        }
        out << YAML::EndMap;

        out << YAML::Key << "permissions" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "readonly_tools" << YAML::Value << permissions.readonly_tools;
        out << YAML::Key << "regular_tools" << YAML::Value << permissions.regular_tools;
        out << YAML::Key << "store_path" << YAML::Value << permissions.store_path.string();
        out << YAML::EndMap;

        out << YAML::Key << "observability" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "log_level" << YAML::Value << observability.log_level;
        out << YAML::Key << "log_path" << YAML::Value << observability.log_path.string();
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream file(expanded);
        if (!file) {
            return Result<void, Error>::err(
                ErrorCode::FileWriteFailed,
                "Failed to open config file for writing",
                expanded.string()
            );
        }

        file << out.c_str();
        return Result<void, Error>::ok();

    } catch (const std::exception& e) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            e.what(),
            path.string()
        );
    }
}

}  // namespace toolgov::core
