#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace toolgov::core {

// JSON alias
using Json = nlohmann::json;

// Time types
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Common type aliases
using ToolRequestId = std::string;
using ToolName = std::string;

// Separator between an extension name and the tool it exposes
inline constexpr std::string_view kExtensionSeparator = "__";

// "developer__shell" -> "developer"; empty when the name is not namespaced
inline std::string extension_of(std::string_view tool_name) {
    auto pos = tool_name.find(kExtensionSeparator);
    if (pos == std::string_view::npos || pos == 0) {
        return {};
    }
    return std::string(tool_name.substr(0, pos));
}

// String member of a JSON object; empty when absent or not a string
inline std::string string_field(const Json& j, std::string_view key) {
    if (!j.is_object()) {
        return {};
    }
    auto it = j.find(std::string(key));
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

// Message roles
enum class Role {
    System,
    User,
    Assistant,
    Tool
};

inline std::string_view role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "unknown";
}

inline Role role_from_string(std::string_view str) {
    if (str == "system") return Role::System;
    if (str == "user") return Role::User;
    if (str == "assistant") return Role::Assistant;
    if (str == "tool") return Role::Tool;
    return Role::User;
}

// How strict the governance pipeline should be for a session
enum class GovernanceMode {
    Auto,          // everything runs without asking
    Approve,       // ask before anything not pre-approved
    SmartApprove,  // like Approve, read-only tools pass
    Chat           // tools are not executed at all
};

inline std::string_view governance_mode_to_string(GovernanceMode mode) {
    switch (mode) {
        case GovernanceMode::Auto: return "auto";
        case GovernanceMode::Approve: return "approve";
        case GovernanceMode::SmartApprove: return "smart_approve";
        case GovernanceMode::Chat: return "chat";
    }
    return "unknown";
}

inline std::optional<GovernanceMode> governance_mode_from_string(std::string_view str) {
    if (str == "auto") return GovernanceMode::Auto;
    if (str == "approve") return GovernanceMode::Approve;
    if (str == "smart_approve") return GovernanceMode::SmartApprove;
    if (str == "chat") return GovernanceMode::Chat;
    return std::nullopt;
}

// A pending tool call proposed by the model
struct ToolRequest {
    ToolRequestId id;
    ToolName tool_name;
    Json arguments = Json::object();

    std::string extension_name() const { return extension_of(tool_name); }

    Json to_json() const {
        return Json{
            {"id", id},
            {"name", tool_name},
            {"arguments", arguments}
        };
    }

    // Malformed members are read as empty instead of throwing
    static ToolRequest from_json(const Json& j) {
        ToolRequest req{
            .id = string_field(j, "id"),
            .tool_name = string_field(j, "name"),
            .arguments = j.is_object() ? j.value("arguments", Json::object()) : Json::object()
        };

        // Some providers send arguments as an encoded JSON string
        if (req.arguments.is_string()) {
            auto parsed = Json::parse(req.arguments.get<std::string>(), nullptr, false);
            if (!parsed.is_discarded()) {
                req.arguments = std::move(parsed);
            }
        }
        return req;
    }
};

// Conversation message, consumed read-only by inspectors
struct Message {
    Role role;
    std::string content;
    std::optional<std::string> name;
    std::vector<ToolRequest> tool_calls;
    std::optional<std::string> tool_call_id;
    TimePoint timestamp;

    Message() : role(Role::User), timestamp(Clock::now()) {}

    Message(Role r, std::string c)
        : role(r), content(std::move(c)), timestamp(Clock::now()) {}

    static Message user(std::string content) {
        return Message{Role::User, std::move(content)};
    }

    static Message assistant(std::string content) {
        return Message{Role::Assistant, std::move(content)};
    }

    static Message system(std::string content) {
        return Message{Role::System, std::move(content)};
    }

    static Message tool_result(std::string tool_call_id, std::string content) {
        Message m{Role::Tool, std::move(content)};
        m.tool_call_id = std::move(tool_call_id);
        return m;
    }

    Json to_json() const {
        Json j{
            {"role", std::string(role_to_string(role))},
            {"content", content},
            {"timestamp", std::chrono::duration_cast<std::chrono::seconds>(
                timestamp.time_since_epoch()).count()}
        };
        if (name) j["name"] = *name;
        if (!tool_calls.empty()) {
            j["tool_calls"] = Json::array();
            for (const auto& tc : tool_calls) {
                j["tool_calls"].push_back(tc.to_json());
            }
        }
        if (tool_call_id) j["tool_call_id"] = *tool_call_id;
        return j;
    }

    static Message from_json(const Json& j) {
        Message m;
        if (!j.is_object()) {
            return m;
        }
        m.role = role_from_string(string_field(j, "role"));
        m.content = string_field(j, "content");
        if (j.contains("name") && j["name"].is_string()) m.name = j["name"].get<std::string>();
        if (j.contains("tool_call_id") && j["tool_call_id"].is_string()) {
            m.tool_call_id = j["tool_call_id"].get<std::string>();
        }
        if (j.contains("tool_calls") && j["tool_calls"].is_array()) {
            for (const auto& tc : j["tool_calls"]) {
                m.tool_calls.push_back(ToolRequest::from_json(tc));
            }
        }
        if (j.contains("timestamp") && j["timestamp"].is_number_integer()) {
            m.timestamp = TimePoint{std::chrono::seconds{j["timestamp"].get<int64_t>()}};
        }
        return m;
    }
};

}  // namespace toolgov::core
