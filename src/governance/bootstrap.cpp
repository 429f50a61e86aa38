#include "toolgov/governance/bootstrap.hpp"
#include "toolgov/inspection/repetition_inspector.hpp"
#include "toolgov/permission/permission_inspector.hpp"

#include <spdlog/spdlog.h>

#include <unordered_set>

namespace toolgov::governance {

std::unique_ptr<inspection::ToolInspectionManager> make_inspection_manager(
    const Config& config,
    std::shared_ptr<permission::PermissionManager> permission_manager) {

    auto manager = std::make_unique<inspection::ToolInspectionManager>(config.inspection);

    std::unordered_set<std::string> readonly_tools(
        config.permissions.readonly_tools.begin(), config.permissions.readonly_tools.end());
    std::unordered_set<std::string> regular_tools(
        config.permissions.regular_tools.begin(), config.permissions.regular_tools.end());

    auto registered = manager->add_inspector(std::make_unique<permission::PermissionInspector>(
        std::move(readonly_tools), std::move(regular_tools), std::move(permission_manager)));
    if (registered.is_err()) {
        spdlog::error("Failed to register permission inspector: {}", registered.error().to_string());
    }

    if (config.repetition.enabled) {
        registered = manager->add_inspector(
            std::make_unique<inspection::RepetitionInspector>(config.repetition.max_repetitions));
        if (registered.is_err()) {
            spdlog::error("Failed to register repetition inspector: {}", registered.error().to_string());
        }
    }

    spdlog::debug("Tool inspection manager ready with {} inspectors ({})",
        manager->size(), manager->is_parallel() ? "parallel" : "sequential");

    return manager;
}

bool update_permission_manager(
    inspection::ToolInspectionManager& manager,
    const std::string& tool_name,
    permission::PermissionLevel level) {

    auto* inspector = manager.find_inspector<permission::PermissionInspector>();
    if (!inspector) {
        spdlog::warn("Permission inspector not found for permission manager update");
        return false;
    }

    inspector->permission_manager().update_user_permission(tool_name, level);
    return true;
}

bool record_confirmation(
    inspection::ToolInspectionManager& manager,
    const ToolRequest& request,
    const permission::PermissionConfirmation& confirmation) {

    auto* inspector = manager.find_inspector<permission::PermissionInspector>();
    if (!inspector) {
        spdlog::warn("Permission inspector not found, confirmation for {} not recorded",
            request.tool_name);
        return false;
    }

    return inspector->permission_manager().apply_confirmation(request, confirmation);
}

std::optional<permission::PermissionCheckResult> process_inspection_results_with_permission_inspector(
    const inspection::ToolInspectionManager& manager,
    const std::vector<ToolRequest>& remaining_requests,
    const std::vector<inspection::InspectionResult>& results) {

    auto* inspector = manager.find_inspector<permission::PermissionInspector>();
    if (!inspector) {
        spdlog::warn("Permission inspector not found for processing inspection results");
        return std::nullopt;
    }

    return inspector->process_inspection_results(remaining_requests, results);
}

}  // namespace toolgov::governance
