#include "toolgov/permission/permission_check.hpp"
#include "toolgov/permission/permission_inspector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_map>

namespace toolgov::permission {

namespace {

bool contains_id(const std::vector<ToolRequest>& requests, const ToolRequestId& id) {
    return std::any_of(requests.begin(), requests.end(),
        [&id](const ToolRequest& req) { return req.id == id; });
}

void remove_id(std::vector<ToolRequest>& requests, const ToolRequestId& id) {
    requests.erase(
        std::remove_if(requests.begin(), requests.end(),
            [&id](const ToolRequest& req) { return req.id == id; }),
        requests.end());
}

Json ids_to_json(const std::vector<ToolRequest>& requests) {
    Json ids = Json::array();
    for (const auto& req : requests) {
        ids.push_back(req.id);
    }
    return ids;
}

}  // namespace

Json PermissionCheckResult::to_json() const {
    return Json{
        {"approved", ids_to_json(approved)},
        {"needs_approval", ids_to_json(needs_approval)},
        {"denied", ids_to_json(denied)}
    };
}

PermissionCheckResult apply_inspection_results_to_permissions(
    PermissionCheckResult base,
    const std::vector<InspectionResult>& results) {

    if (results.empty()) {
        return base;
    }

    std::unordered_map<ToolRequestId, ToolRequest> all_requests;
    for (const auto* list : {&base.approved, &base.needs_approval, &base.denied}) {
        for (const auto& req : *list) {
            all_requests.emplace(req.id, req);
        }
    }

    for (const auto& result : results) {
        const auto& id = result.tool_request_id;

        spdlog::debug("Applying inspection result: inspector={} request={} action={} confidence={} reason={}",
            result.inspector_name, id, inspection::action_kind_to_string(result.action.kind()),
            result.confidence, result.reason);

        auto it = all_requests.find(id);
        if (it == all_requests.end()) {
            continue;
        }

        switch (result.action.kind()) {
            case inspection::ActionKind::Deny:
                remove_id(base.approved, id);
                remove_id(base.needs_approval, id);
                if (!contains_id(base.denied, id)) {
                    base.denied.push_back(it->second);
                }
                break;

            case inspection::ActionKind::RequireApproval:
                if (contains_id(base.denied, id)) {
                    break;
                }
                remove_id(base.approved, id);
                if (!contains_id(base.needs_approval, id)) {
                    base.needs_approval.push_back(it->second);
                }
                break;

            case inspection::ActionKind::Allow:
                break;
        }
    }

    return base;
}

PermissionCheckResult process_inspection_results(
    const std::vector<ToolRequest>& tool_requests,
    const std::vector<InspectionResult>& results) {

    PermissionCheckResult check;
    std::vector<InspectionResult> overrides;

    for (const auto& request : tool_requests) {
        auto it = std::find_if(results.begin(), results.end(),
            [&request](const InspectionResult& r) {
                return r.inspector_name == kPermissionInspectorName && r.tool_request_id == request.id;
            });

        if (it == results.end()) {
            check.needs_approval.push_back(request);
            continue;
        }

        switch (it->action.kind()) {
            case inspection::ActionKind::Allow:
                check.approved.push_back(request);
                break;
            case inspection::ActionKind::Deny:
                check.denied.push_back(request);
                break;
            case inspection::ActionKind::RequireApproval:
                check.needs_approval.push_back(request);
                break;
        }
    }

    for (const auto& result : results) {
        if (result.inspector_name != kPermissionInspectorName) {
            overrides.push_back(result);
        }
    }

    return apply_inspection_results_to_permissions(std::move(check), overrides);
}

PermissionCheckResult resolve_inspection_results(
    const std::vector<ToolRequest>& tool_requests,
    const std::vector<InspectionResult>& results) {

    PermissionCheckResult check;

    for (const auto& request : tool_requests) {
        int worst = -1;
        for (const auto& result : results) {
            if (result.tool_request_id == request.id) {
                worst = std::max(worst, result.action.severity());
            }
        }

        if (worst < 0) {
            check.needs_approval.push_back(request);
        } else if (worst == inspection::InspectionAction::deny().severity()) {
            check.denied.push_back(request);
        } else if (worst == inspection::InspectionAction::require_approval().severity()) {
            check.needs_approval.push_back(request);
        } else {
            check.approved.push_back(request);
        }
    }

    return check;
}

std::vector<std::string> approval_notes(
    const ToolRequestId& tool_request_id,
    const std::vector<InspectionResult>& results) {

    std::vector<std::string> notes;
    for (const auto& result : results) {
        if (result.tool_request_id == tool_request_id
            && result.action.requires_approval() && result.action.note()) {
            notes.push_back(*result.action.note());
        }
    }
    return notes;
}

std::optional<std::string> find_finding_id(
    const ToolRequestId& tool_request_id,
    std::string_view inspector_name,
    const std::vector<InspectionResult>& results) {

    for (const auto& result : results) {
        if (result.tool_request_id == tool_request_id && result.inspector_name == inspector_name) {
            return result.finding_id;
        }
    }
    return std::nullopt;
}

}  // namespace toolgov::permission
