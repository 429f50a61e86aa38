#include "toolgov/permission/permission_inspector.hpp"

#include <spdlog/spdlog.h>

namespace toolgov::permission {

PermissionInspector::PermissionInspector(std::unordered_set<std::string> readonly_tools,
                                         std::unordered_set<std::string> regular_tools,
                                         std::shared_ptr<PermissionManager> permission_manager)
    : readonly_tools_(std::move(readonly_tools))
    , regular_tools_(std::move(regular_tools))
    , permission_manager_(permission_manager ? std::move(permission_manager)
                                             : std::make_shared<PermissionManager>())
{
}

InspectionAction PermissionInspector::decide(const std::string& tool_name, GovernanceMode mode) const {
    if (mode == GovernanceMode::Auto) {
        return InspectionAction::allow();
    }

    // 1. Standing user policy
    if (auto level = permission_manager_->get_user_permission(tool_name)) {
        switch (*level) {
            case PermissionLevel::AlwaysAllow: return InspectionAction::allow();
            case PermissionLevel::NeverAllow: return InspectionAction::deny();
            case PermissionLevel::AskBefore: return InspectionAction::require_approval();
        }
    }

    // 2. Read-only and pre-approved tools
    if (readonly_tools_.count(tool_name) || regular_tools_.count(tool_name)) {
        return InspectionAction::allow();
    }

    // 3. Extension management
    if (tool_name == kManageExtensionsToolName) {
        return InspectionAction::require_approval(
            std::string("Extension management requires approval for security"));
    }

    return InspectionAction::require_approval();
}

std::string PermissionInspector::reason_for(const InspectionAction& action,
                                            const std::string& tool_name,
                                            GovernanceMode mode) const {
    switch (action.kind()) {
        case inspection::ActionKind::Allow:
            if (mode == GovernanceMode::Auto) {
                return "Auto mode - all tools approved";
            }
            if (readonly_tools_.count(tool_name)) {
                return "Tool marked as read-only";
            }
            if (regular_tools_.count(tool_name)) {
                return "Tool pre-approved";
            }
            return "User permission allows this tool";

        case inspection::ActionKind::Deny:
            return "User permission denies this tool";

        case inspection::ActionKind::RequireApproval:
            if (tool_name == kManageExtensionsToolName) {
                return "Extension management requires user approval";
            }
            return "Tool requires user approval";
    }
    return "Tool requires user approval";
}

Result<InspectionResults, Error> PermissionInspector::inspect(
    const std::vector<ToolRequest>& tool_requests,
    const std::vector<Message>& /*messages*/,
    GovernanceMode mode) {

    InspectionResults results;

    if (mode == GovernanceMode::Chat) {
        return Result<InspectionResults, Error>::ok(std::move(results));
    }

    results.reserve(tool_requests.size());

    for (const auto& request : tool_requests) {
        auto action = decide(request.tool_name, mode);
        auto reason = reason_for(action, request.tool_name, mode);

        results.push_back(inspection::InspectionResult{
            .tool_request_id = request.id,
            .action = std::move(action),
            .reason = std::move(reason),
            .confidence = 1.0f,
            .inspector_name = std::string(kPermissionInspectorName),
            .finding_id = std::nullopt
        });
    }

    return Result<InspectionResults, Error>::ok(std::move(results));
}

PermissionCheckResult PermissionInspector::process_inspection_results(
    const std::vector<ToolRequest>& remaining_requests,
    const std::vector<inspection::InspectionResult>& results) const {

    return permission::process_inspection_results(remaining_requests, results);
}

}  // namespace toolgov::permission
