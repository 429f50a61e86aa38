#pragma once

#include "toolgov/core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace toolgov::inspection {

using namespace toolgov::core;

enum class ActionKind {
    Allow,            // no objection
    Deny,             // block execution outright
    RequireApproval   // pause for an explicit decision
};

inline std::string_view action_kind_to_string(ActionKind kind) {
    switch (kind) {
        case ActionKind::Allow: return "allow";
        case ActionKind::Deny: return "deny";
        case ActionKind::RequireApproval: return "require_approval";
    }
    return "unknown";
}

// Verdict an inspector reaches on one tool request. Only RequireApproval
// carries a note, shown to whoever makes the decision.
class InspectionAction {
public:
    static InspectionAction allow() { return InspectionAction{ActionKind::Allow, std::nullopt}; }
    static InspectionAction deny() { return InspectionAction{ActionKind::Deny, std::nullopt}; }
    static InspectionAction require_approval(std::optional<std::string> note = std::nullopt) {
        return InspectionAction{ActionKind::RequireApproval, std::move(note)};
    }

    ActionKind kind() const { return kind_; }
    const std::optional<std::string>& note() const { return note_; }

    bool is_allow() const { return kind_ == ActionKind::Allow; }
    bool is_deny() const { return kind_ == ActionKind::Deny; }
    bool requires_approval() const { return kind_ == ActionKind::RequireApproval; }

    // Deny > RequireApproval > Allow
    int severity() const {
        switch (kind_) {
            case ActionKind::Allow: return 0;
            case ActionKind::RequireApproval: return 1;
            case ActionKind::Deny: return 2;
        }
        return 0;
    }

    bool operator==(const InspectionAction& other) const {
        return kind_ == other.kind_ && note_ == other.note_;
    }
    bool operator!=(const InspectionAction& other) const { return !(*this == other); }

    Json to_json() const {
        Json j{{"type", std::string(action_kind_to_string(kind_))}};
        if (note_) j["note"] = *note_;
        return j;
    }

private:
    InspectionAction(ActionKind kind, std::optional<std::string> note)
        : kind_(kind), note_(std::move(note)) {}

    ActionKind kind_;
    std::optional<std::string> note_;
};

// One inspector's verdict on one tool request
struct InspectionResult {
    ToolRequestId tool_request_id;
    InspectionAction action = InspectionAction::allow();
    std::string reason;
    float confidence = 1.0f;  // in [0, 1]
    std::string inspector_name;
    std::optional<std::string> finding_id;  // correlates to a detailed external record

    Json to_json() const {
        Json j{
            {"tool_request_id", tool_request_id},
            {"action", action.to_json()},
            {"reason", reason},
            {"confidence", confidence},
            {"inspector_name", inspector_name}
        };
        if (finding_id) j["finding_id"] = *finding_id;
        return j;
    }
};

}  // namespace toolgov::inspection
