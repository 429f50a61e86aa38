#pragma once

#include "toolgov/core/types.hpp"
#include "toolgov/inspection/inspection_result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolgov::permission {

using namespace toolgov::core;
using inspection::InspectionResult;

// Requests of one batch sorted by what happens to them next
struct PermissionCheckResult {
    std::vector<ToolRequest> approved;
    std::vector<ToolRequest> needs_approval;
    std::vector<ToolRequest> denied;

    Json to_json() const;
};

// Overlay inspection verdicts on an existing decision. Deny moves a request
// to denied, RequireApproval moves an approved request to needs_approval,
// Allow never relaxes what another inspector decided. Results for requests
// not present in base are ignored.
PermissionCheckResult apply_inspection_results_to_permissions(
    PermissionCheckResult base,
    const std::vector<InspectionResult>& results);

// Baseline from the "permission" inspector (a request it said nothing about
// needs approval), then every other inspector's verdicts as overrides.
PermissionCheckResult process_inspection_results(
    const std::vector<ToolRequest>& tool_requests,
    const std::vector<InspectionResult>& results);

// Most restrictive verdict wins per request: Deny, then RequireApproval, then
// Allow. A request no inspector spoke about needs approval.
PermissionCheckResult resolve_inspection_results(
    const std::vector<ToolRequest>& tool_requests,
    const std::vector<InspectionResult>& results);

// Approval notes collected for one request, in result order
std::vector<std::string> approval_notes(
    const ToolRequestId& tool_request_id,
    const std::vector<InspectionResult>& results);

std::optional<std::string> find_finding_id(
    const ToolRequestId& tool_request_id,
    std::string_view inspector_name,
    const std::vector<InspectionResult>& results);

}  // namespace toolgov::permission
