#pragma once

#include "toolgov/core/config.hpp"
#include "toolgov/inspection/tool_inspection_manager.hpp"
#include "toolgov/permission/permission_check.hpp"
#include "toolgov/permission/permission_manager.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolgov::governance {

using namespace toolgov::core;

// Manager for one agent session: "permission" first, then "repetition" when
// enabled. Never share the result between sessions.
std::unique_ptr<inspection::ToolInspectionManager> make_inspection_manager(
    const Config& config,
    std::shared_ptr<permission::PermissionManager> permission_manager);

// Write a standing policy through the registered permission inspector.
// Returns false when the manager has no permission inspector.
bool update_permission_manager(
    inspection::ToolInspectionManager& manager,
    const std::string& tool_name,
    permission::PermissionLevel level);

// Route a decision-maker's answer to the permission inspector's store
bool record_confirmation(
    inspection::ToolInspectionManager& manager,
    const ToolRequest& request,
    const permission::PermissionConfirmation& confirmation);

// Delegates to the permission inspector; nullopt when none is registered
std::optional<permission::PermissionCheckResult> process_inspection_results_with_permission_inspector(
    const inspection::ToolInspectionManager& manager,
    const std::vector<ToolRequest>& remaining_requests,
    const std::vector<inspection::InspectionResult>& results);

}  // namespace toolgov::governance
