#pragma once

#include "toolgov/inspection/tool_inspector.hpp"
#include "permission_check.hpp"
#include "permission_manager.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace toolgov::permission {

using namespace toolgov::core;
using inspection::InspectionAction;
using inspection::InspectionResults;

inline constexpr std::string_view kPermissionInspectorName = "permission";

// Enabling/disabling extensions always goes to a human
inline constexpr std::string_view kManageExtensionsToolName = "extensionmanager__manage_extensions";

// Turns the governance mode, the standing policies in the PermissionManager
// and the pre-approved tool lists into one verdict per request.
//
//   chat           -> no verdicts, nothing runs
//   auto           -> allow
//   approve/smart  -> standing policy, else read-only or pre-approved tools
//                     are allowed, else approval is required
class PermissionInspector : public inspection::ToolInspector {
public:
    PermissionInspector(std::unordered_set<std::string> readonly_tools,
                        std::unordered_set<std::string> regular_tools,
                        std::shared_ptr<PermissionManager> permission_manager);

    std::string_view name() const override { return kPermissionInspectorName; }

    Result<InspectionResults, Error> inspect(
        const std::vector<ToolRequest>& tool_requests,
        const std::vector<Message>& messages,
        GovernanceMode mode) override;

    // Permission verdicts as the baseline, other inspectors as overrides
    PermissionCheckResult process_inspection_results(
        const std::vector<ToolRequest>& remaining_requests,
        const std::vector<inspection::InspectionResult>& results) const;

    PermissionManager& permission_manager() { return *permission_manager_; }
    const PermissionManager& permission_manager() const { return *permission_manager_; }

private:
    InspectionAction decide(const std::string& tool_name, GovernanceMode mode) const;
    std::string reason_for(const InspectionAction& action, const std::string& tool_name,
                           GovernanceMode mode) const;

    std::unordered_set<std::string> readonly_tools_;
    std::unordered_set<std::string> regular_tools_;
    std::shared_ptr<PermissionManager> permission_manager_;
};

}  // namespace toolgov::permission
