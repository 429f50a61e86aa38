#pragma once

#include "toolgov/core/result.hpp"
#include "toolgov/core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace toolgov::permission {

using namespace toolgov::core;

// Answer a decision-maker gives to an approval prompt.
// *Once answers cover the pending call only; Always* answers ask the caller
// to keep a standing policy for the principal; Cancel records nothing.
enum class Permission {
    AlwaysAllow,
    AllowOnce,
    Cancel,
    DenyOnce,
    AlwaysDeny
};

// Granularity a standing policy is scoped to
enum class PrincipalType {
    Extension,  // every tool the extension exposes
    Tool        // one named tool
};

inline std::string_view permission_to_string(Permission permission) {
    switch (permission) {
        case Permission::AlwaysAllow: return "always_allow";
        case Permission::AllowOnce: return "allow_once";
        case Permission::Cancel: return "cancel";
        case Permission::DenyOnce: return "deny_once";
        case Permission::AlwaysDeny: return "always_deny";
    }
    return "cancel";
}

inline std::optional<Permission> permission_from_string(std::string_view str) {
    if (str == "always_allow") return Permission::AlwaysAllow;
    if (str == "allow_once") return Permission::AllowOnce;
    if (str == "cancel") return Permission::Cancel;
    if (str == "deny_once") return Permission::DenyOnce;
    if (str == "always_deny") return Permission::AlwaysDeny;
    return std::nullopt;
}

inline std::string_view principal_type_to_string(PrincipalType type) {
    switch (type) {
        case PrincipalType::Extension: return "extension";
        case PrincipalType::Tool: return "tool";
    }
    return "tool";
}

inline std::optional<PrincipalType> principal_type_from_string(std::string_view str) {
    if (str == "extension") return PrincipalType::Extension;
    if (str == "tool") return PrincipalType::Tool;
    return std::nullopt;
}

// Whether the pending call goes ahead
inline bool is_allowing(Permission permission) {
    return permission == Permission::AlwaysAllow || permission == Permission::AllowOnce;
}

// Whether the answer should be remembered against the principal
inline bool is_standing(Permission permission) {
    return permission == Permission::AlwaysAllow || permission == Permission::AlwaysDeny;
}

struct PermissionConfirmation {
    PrincipalType principal_type = PrincipalType::Tool;
    Permission permission = Permission::Cancel;

    bool operator==(const PermissionConfirmation& other) const {
        return principal_type == other.principal_type && permission == other.permission;
    }

    Json to_json() const {
        return Json{
            {"principal_type", std::string(principal_type_to_string(principal_type))},
            {"permission", std::string(permission_to_string(permission))}
        };
    }

    static Result<PermissionConfirmation, Error> from_json(const Json& j) {
        if (!j.is_object()) {
            return Result<PermissionConfirmation, Error>::err(
                ErrorCode::InvalidArgument,
                "Confirmation must be a JSON object",
                j.dump()
            );
        }

        auto principal_text = j.contains("principal_type") ? string_field(j, "principal_type")
                                                           : std::string("tool");
        auto principal = principal_type_from_string(principal_text);
        if (!principal) {
            return Result<PermissionConfirmation, Error>::err(
                ErrorCode::InvalidArgument,
                "Unknown principal_type",
                j["principal_type"].dump()
            );
        }

        auto permission = permission_from_string(string_field(j, "permission"));
        if (!permission) {
            return Result<PermissionConfirmation, Error>::err(
                ErrorCode::UnknownPermission,
                "Unknown permission",
                j.value("permission", Json()).dump()
            );
        }

        return Result<PermissionConfirmation, Error>::ok(
            PermissionConfirmation{*principal, *permission});
    }
};

}  // namespace toolgov::permission
