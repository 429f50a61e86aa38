#pragma once

#include "toolgov/core/result.hpp"
#include "toolgov/core/types.hpp"
#include "permission_confirmation.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace toolgov::permission {

using namespace toolgov::core;
namespace fs = std::filesystem;

// Standing policy for a principal
enum class PermissionLevel {
    AlwaysAllow,
    AskBefore,
    NeverAllow
};

inline std::string_view permission_level_to_string(PermissionLevel level) {
    switch (level) {
        case PermissionLevel::AlwaysAllow: return "always_allow";
        case PermissionLevel::AskBefore: return "ask_before";
        case PermissionLevel::NeverAllow: return "never_allow";
    }
    return "ask_before";
}

inline std::optional<PermissionLevel> permission_level_from_string(std::string_view str) {
    if (str == "always_allow") return PermissionLevel::AlwaysAllow;
    if (str == "ask_before") return PermissionLevel::AskBefore;
    if (str == "never_allow") return PermissionLevel::NeverAllow;
    return std::nullopt;
}

// Remembers "Always" decisions per tool and per extension. Lookups check the
// tool first, then the extension the tool belongs to.
class PermissionManager {
public:
    PermissionManager() = default;

    std::optional<PermissionLevel> get_user_permission(const std::string& tool_name) const;

    std::optional<PermissionLevel> get_tool_permission(const std::string& tool_name) const;
    std::optional<PermissionLevel> get_extension_permission(const std::string& extension) const;

    void update_user_permission(const std::string& tool_name, PermissionLevel level);
    void update_extension_permission(const std::string& extension, PermissionLevel level);

    bool remove_user_permission(const std::string& tool_name);
    bool remove_extension_permission(const std::string& extension);

    // Record a standing policy for an Always* answer at the confirmation's
    // principal granularity. Returns false when nothing was recorded (a
    // once/cancel answer, or an extension principal on an un-namespaced tool).
    bool apply_confirmation(const ToolRequest& request, const PermissionConfirmation& confirmation);

    void clear();

    std::map<std::string, PermissionLevel> tool_permissions() const;
    std::map<std::string, PermissionLevel> extension_permissions() const;

    // YAML persistence
    Result<void, Error> save(const fs::path& path) const;
    static Result<PermissionManager, Error> load(const fs::path& path);

    PermissionManager(PermissionManager&& other) noexcept;
    PermissionManager& operator=(PermissionManager&& other) noexcept;

private:
    mutable std::mutex mutex_;
    std::map<std::string, PermissionLevel> tools_;
    std::map<std::string, PermissionLevel> extensions_;
};

}  // namespace toolgov::permission
