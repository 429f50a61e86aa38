#include <catch2/catch_test_macros.hpp>
#include "toolgov/permission/permission_inspector.hpp"

using namespace toolgov::permission;

namespace {

PermissionInspector make_inspector(std::shared_ptr<PermissionManager> store = nullptr) {
    return PermissionInspector(
        {"developer__read_file"},
        {"todo__write"},
        std::move(store));
}

std::vector<ToolRequest> batch_of(std::initializer_list<const char*> names) {
    std::vector<ToolRequest> requests;
    int i = 0;
    for (const char* name : names) {
        requests.push_back(ToolRequest{.id = "req_" + std::to_string(++i), .tool_name = name});
    }
    return requests;
}

}  // namespace

TEST_CASE("Chat mode produces no verdicts", "[permission_inspector]") {
    auto inspector = make_inspector();
    auto result = inspector.inspect(batch_of({"developer__shell"}), {}, GovernanceMode::Chat);

    REQUIRE(result.is_ok());
    REQUIRE(result.value().empty());
}

TEST_CASE("Auto mode allows everything", "[permission_inspector]") {
    auto store = std::make_shared<PermissionManager>();
    store->update_user_permission("developer__shell", PermissionLevel::NeverAllow);
    auto inspector = make_inspector(store);

    auto result = inspector.inspect(batch_of({"developer__shell", "unknown"}), {}, GovernanceMode::Auto);

    REQUIRE(result.value().size() == 2);
    for (const auto& verdict : result.value()) {
        REQUIRE(verdict.action.is_allow());
        REQUIRE(verdict.reason == "Auto mode - all tools approved");
        REQUIRE(verdict.inspector_name == "permission");
    }
}

TEST_CASE("Standing policy decides in approve modes", "[permission_inspector]") {
    auto store = std::make_shared<PermissionManager>();
    store->update_user_permission("developer__shell", PermissionLevel::AlwaysAllow);
    store->update_extension_permission("github", PermissionLevel::NeverAllow);
    store->update_user_permission("todo__write", PermissionLevel::AskBefore);
    auto inspector = make_inspector(store);

    for (auto mode : {GovernanceMode::Approve, GovernanceMode::SmartApprove}) {
        auto result = inspector.inspect(
            batch_of({"developer__shell", "github__delete_repo", "todo__write"}), {}, mode);
        const auto& verdicts = result.value();

        REQUIRE(verdicts.size() == 3);
        REQUIRE(verdicts[0].action.is_allow());
        REQUIRE(verdicts[0].reason == "User permission allows this tool");
        REQUIRE(verdicts[1].action.is_deny());
        REQUIRE(verdicts[1].reason == "User permission denies this tool");
        REQUIRE(verdicts[2].action.requires_approval());
    }
}

TEST_CASE("Pre-approved tools pass without a policy", "[permission_inspector]") {
    auto inspector = make_inspector();
    auto result = inspector.inspect(
        batch_of({"developer__read_file", "todo__write", "developer__shell"}), {}, GovernanceMode::SmartApprove);
    const auto& verdicts = result.value();

    REQUIRE(verdicts[0].action.is_allow());
    REQUIRE(verdicts[0].reason == "Tool marked as read-only");
    REQUIRE(verdicts[1].action.is_allow());
    REQUIRE(verdicts[1].reason == "Tool pre-approved");
    REQUIRE(verdicts[2].action.requires_approval());
    REQUIRE(verdicts[2].reason == "Tool requires user approval");
    REQUIRE_FALSE(verdicts[2].action.note().has_value());
}

TEST_CASE("Extension management always needs approval", "[permission_inspector]") {
    auto inspector = make_inspector();
    auto result = inspector.inspect(
        batch_of({"extensionmanager__manage_extensions"}), {}, GovernanceMode::Approve);
    const auto& verdict = result.value().front();

    REQUIRE(verdict.action.requires_approval());
    REQUIRE(verdict.action.note() == std::optional<std::string>(
        "Extension management requires approval for security"));
    REQUIRE(verdict.reason == "Extension management requires user approval");
}

TEST_CASE("Store changes are seen by the next batch", "[permission_inspector]") {
    auto inspector = make_inspector();
    auto batch = batch_of({"developer__shell"});

    REQUIRE(inspector.inspect(batch, {}, GovernanceMode::Approve).value().front().action.requires_approval());

    inspector.permission_manager().update_user_permission("developer__shell", PermissionLevel::AlwaysAllow);
    REQUIRE(inspector.inspect(batch, {}, GovernanceMode::Approve).value().front().action.is_allow());
}

TEST_CASE("Pre-approval reason wins over a matching policy", "[permission_inspector]") {
    auto store = std::make_shared<PermissionManager>();
    store->update_user_permission("developer__read_file", PermissionLevel::AlwaysAllow);
    store->update_user_permission("todo__write", PermissionLevel::AlwaysAllow);
    auto inspector = make_inspector(store);

    auto result = inspector.inspect(
        batch_of({"developer__read_file", "todo__write"}), {}, GovernanceMode::Approve);
    const auto& verdicts = result.value();

    REQUIRE(verdicts[0].action.is_allow());
    REQUIRE(verdicts[0].reason == "Tool marked as read-only");
    REQUIRE(verdicts[1].action.is_allow());
    REQUIRE(verdicts[1].reason == "Tool pre-approved");
}
