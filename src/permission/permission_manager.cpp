#include "toolgov/permission/permission_manager.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <fstream>

namespace toolgov::permission {

namespace {

Result<std::map<std::string, PermissionLevel>, Error> read_levels(
    const YAML::Node& node, const std::string& section) {

    std::map<std::string, PermissionLevel> levels;
    if (!node) {
        return Result<std::map<std::string, PermissionLevel>, Error>::ok(std::move(levels));
    }

    if (!node.IsMap()) {
        return Result<std::map<std::string, PermissionLevel>, Error>::err(
            ErrorCode::PermissionStoreCorrupted,
            "Permission section must be a map",
            section
        );
    }

    for (const auto& entry : node) {
        auto principal = entry.first.as<std::string>();
        auto text = entry.second.as<std::string>();
        auto level = permission_level_from_string(text);
        if (!level) {
            return Result<std::map<std::string, PermissionLevel>, Error>::err(
                ErrorCode::PermissionStoreCorrupted,
                "Unknown permission level '" + text + "'",
                section + "." + principal
            );
        }
        levels[principal] = *level;
    }

    return Result<std::map<std::string, PermissionLevel>, Error>::ok(std::move(levels));
}

}  // namespace

PermissionManager::PermissionManager(PermissionManager&& other) noexcept {
    std::lock_guard<std::mutex> lock(other.mutex_);
    tools_ = std::move(other.tools_);
    extensions_ = std::move(other.extensions_);
}

PermissionManager& PermissionManager::operator=(PermissionManager&& other) noexcept {
    if (this != &other) {
        std::scoped_lock lock(mutex_, other.mutex_);
        tools_ = std::move(other.tools_);
        extensions_ = std::move(other.extensions_);
    }
    return *this;
}

std::optional<PermissionLevel> PermissionManager::get_user_permission(const std::string& tool_name) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tools_.find(tool_name);
    if (it != tools_.end()) {
        return it->second;
    }

    auto extension = extension_of(tool_name);
    if (!extension.empty()) {
        auto ext_it = extensions_.find(extension);
        if (ext_it != extensions_.end()) {
            return ext_it->second;
        }
    }

    return std::nullopt;
}

std::optional<PermissionLevel> PermissionManager::get_tool_permission(const std::string& tool_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tools_.find(tool_name);
    if (it == tools_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<PermissionLevel> PermissionManager::get_extension_permission(const std::string& extension) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = extensions_.find(extension);
    if (it == extensions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void PermissionManager::update_user_permission(const std::string& tool_name, PermissionLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    tools_[tool_name] = level;
}

void PermissionManager::update_extension_permission(const std::string& extension, PermissionLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    extensions_[extension] = level;
}

bool PermissionManager::remove_user_permission(const std::string& tool_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.erase(tool_name) > 0;
}

bool PermissionManager::remove_extension_permission(const std::string& extension) {
    std::lock_guard<std::mutex> lock(mutex_);
    return extensions_.erase(extension) > 0;
}

bool PermissionManager::apply_confirmation(const ToolRequest& request,
                                           const PermissionConfirmation& confirmation) {
    if (!is_standing(confirmation.permission)) {
        return false;
    }

    auto level = confirmation.permission == Permission::AlwaysAllow
        ? PermissionLevel::AlwaysAllow
        : PermissionLevel::NeverAllow;

    switch (confirmation.principal_type) {
        case PrincipalType::Tool:
            update_user_permission(request.tool_name, level);
            spdlog::info("Recorded {} for tool {}",
                permission_level_to_string(level), request.tool_name);
            return true;

        case PrincipalType::Extension: {
            auto extension = request.extension_name();
            if (extension.empty()) {
                spdlog::warn("Cannot record extension permission for un-namespaced tool {}",
                    request.tool_name);
                return false;
            }
            update_extension_permission(extension, level);
            spdlog::info("Recorded {} for extension {}",
                permission_level_to_string(level), extension);
            return true;
        }
    }

    return false;
}

void PermissionManager::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    tools_.clear();
    extensions_.clear();
}

std::map<std::string, PermissionLevel> PermissionManager::tool_permissions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_;
}

std::map<std::string, PermissionLevel> PermissionManager::extension_permissions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return extensions_;
}

Result<void, Error> PermissionManager::save(const fs::path& path) const {
    try {
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }

        YAML::Emitter out;
        out << YAML::BeginMap;

        {
            std::lock_guard<std::mutex> lock(mutex_);

            out << YAML::Key << "tools" << YAML::Value << YAML::BeginMap;
            for (const auto& [tool, level] : tools_) {
                out << YAML::Key << tool << YAML::Value << std::string(permission_level_to_string(level));
            }
            out << YAML::EndMap;

            out << YAML::Key << "extensions" << YAML::Value << YAML::BeginMap;
            for (const auto& [extension, level] : extensions_) {
                out << YAML::Key << extension << YAML::Value << std::string(permission_level_to_string(level));
            }
            out << YAML::EndMap;
        }

        out << YAML::EndMap;

        std::ofstream file(path);
        if (!file) {
            return Result<void, Error>::err(
                ErrorCode::PermissionStoreSaveFailed,
                "Failed to open permission store for writing",
                path.string()
            );
        }

        file << out.c_str();
        return Result<void, Error>::ok();

    } catch (const std::exception& e) {
        return Result<void, Error>::err(
            ErrorCode::PermissionStoreSaveFailed,
            e.what(),
            path.string()
        );
    }
}

Result<PermissionManager, Error> PermissionManager::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<PermissionManager, Error>::err(
            ErrorCode::FileNotFound,
            "Permission store not found",
            path.string()
        );
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        auto tools = read_levels(root["tools"], "tools");
        if (tools.is_err()) {
            return Result<PermissionManager, Error>::err(std::move(tools).error());
        }

        auto extensions = read_levels(root["extensions"], "extensions");
        if (extensions.is_err()) {
            return Result<PermissionManager, Error>::err(std::move(extensions).error());
        }

        PermissionManager manager;
        manager.tools_ = std::move(tools).value();
        manager.extensions_ = std::move(extensions).value();

        spdlog::debug("Loaded {} tool and {} extension permissions from {}",
            manager.tools_.size(), manager.extensions_.size(), path.string());

        return Result<PermissionManager, Error>::ok(std::move(manager));

    } catch (const YAML::Exception& e) {
        return Result<PermissionManager, Error>::err(
            ErrorCode::PermissionStoreLoadFailed,
            std::string("YAML parse error: ") + e.what(),
            path.string()
        );
    }
}

}  // namespace toolgov::permission
