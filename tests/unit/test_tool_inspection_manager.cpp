#include <catch2/catch_test_macros.hpp>
#include "toolgov/inspection/repetition_inspector.hpp"
#include "toolgov/inspection/tool_inspection_manager.hpp"

#include <atomic>
#include <stdexcept>

using namespace toolgov::inspection;

namespace {

// Returns one fixed verdict per request
class FixedInspector : public ToolInspector {
public:
    FixedInspector(std::string name, InspectionAction action, bool enabled = true)
        : name_(std::move(name)), action_(std::move(action)), enabled_(enabled) {}

    std::string_view name() const override { return name_; }
    bool is_enabled() const override { return enabled_; }

    Result<InspectionResults, Error> inspect(
        const std::vector<ToolRequest>& tool_requests,
        const std::vector<Message>& /*messages*/,
        GovernanceMode /*mode*/) override {
        ++calls;
        InspectionResults results;
        for (const auto& request : tool_requests) {
            results.push_back(InspectionResult{
                .tool_request_id = request.id,
                .action = action_,
                .reason = "fixed",
                .confidence = 0.5f,
                .inspector_name = name_,
                .finding_id = std::nullopt
            });
        }
        return Result<InspectionResults, Error>::ok(std::move(results));
    }

    std::atomic<int> calls{0};

private:
    std::string name_;
    InspectionAction action_;
    bool enabled_;
};

class FailingInspector : public ToolInspector {
public:
    explicit FailingInspector(std::string name) : name_(std::move(name)) {}

    std::string_view name() const override { return name_; }

    Result<InspectionResults, Error> inspect(
        const std::vector<ToolRequest>&, const std::vector<Message>&, GovernanceMode) override {
        return Result<InspectionResults, Error>::err(ErrorCode::InspectorFailed, "model unavailable", name_);
    }

private:
    std::string name_;
};

class ThrowingInspector : public ToolInspector {
public:
    std::string_view name() const override { return "throwing"; }

    Result<InspectionResults, Error> inspect(
        const std::vector<ToolRequest>&, const std::vector<Message>&, GovernanceMode) override {
        throw std::runtime_error("unexpected payload");
    }
};

std::vector<ToolRequest> sample_batch() {
    return {
        ToolRequest{.id = "req_1", .tool_name = "developer__shell", .arguments = Json{{"command", "ls"}}},
        ToolRequest{.id = "req_2", .tool_name = "fetch_user", .arguments = Json{{"user_id", 1}}}
    };
}

}  // namespace

TEST_CASE("Empty manager returns no results", "[manager]") {
    ToolInspectionManager manager;

    REQUIRE(manager.size() == 0);
    REQUIRE(manager.inspector_names().empty());
    REQUIRE(manager.inspect_tools(sample_batch(), {}, GovernanceMode::Approve).empty());
}

TEST_CASE("Failing inspector is isolated", "[manager]") {
    ToolInspectionManager manager;
    REQUIRE(manager.add_inspector(std::make_unique<FixedInspector>("ok", InspectionAction::allow())).is_ok());
    REQUIRE(manager.add_inspector(std::make_unique<FailingInspector>("err")).is_ok());

    auto results = manager.inspect_tools(sample_batch(), {}, GovernanceMode::SmartApprove);

    REQUIRE(results.size() == 2);
    REQUIRE(results[0].inspector_name == "ok");
    REQUIRE(results[0].tool_request_id == "req_1");
    REQUIRE(results[1].inspector_name == "ok");
    REQUIRE(results[1].tool_request_id == "req_2");
    REQUIRE(results[0].action.is_allow());
    REQUIRE(manager.inspector_names() == std::vector<std::string>{"ok", "err"});
}

TEST_CASE("Results follow registration order", "[manager]") {
    ToolInspectionManager manager;
    REQUIRE(manager.add_inspector(std::make_unique<FixedInspector>("first", InspectionAction::allow())).is_ok());
    REQUIRE(manager.add_inspector(std::make_unique<FixedInspector>(
        "second", InspectionAction::require_approval(std::string("double check")))).is_ok());

    auto results = manager.inspect_tools(sample_batch(), {}, GovernanceMode::Approve);

    REQUIRE(results.size() == 4);
    REQUIRE(results[0].inspector_name == "first");
    REQUIRE(results[0].tool_request_id == "req_1");
    REQUIRE(results[1].inspector_name == "first");
    REQUIRE(results[1].tool_request_id == "req_2");
    REQUIRE(results[2].inspector_name == "second");
    REQUIRE(results[2].action.note() == std::optional<std::string>("double check"));
    REQUIRE(results[2].confidence == 0.5f);
    REQUIRE(results[3].inspector_name == "second");
}

TEST_CASE("Parallel manager keeps registration order", "[manager]") {
    ToolInspectionManager manager(InspectionConfig{.parallel = true, .thread_pool_size = 4});
    REQUIRE(manager.is_parallel());

    for (const char* name : {"a", "b", "c", "d", "e"}) {
        REQUIRE(manager.add_inspector(std::make_unique<FixedInspector>(name, InspectionAction::allow())).is_ok());
    }
    REQUIRE(manager.add_inspector(std::make_unique<FailingInspector>("broken")).is_ok());

    for (int round = 0; round < 10; ++round) {
        auto results = manager.inspect_tools(sample_batch(), {}, GovernanceMode::Approve);
        REQUIRE(results.size() == 10);
        REQUIRE(results[0].inspector_name == "a");
        REQUIRE(results[4].inspector_name == "c");
        REQUIRE(results[9].inspector_name == "e");
    }
}

TEST_CASE("Sequential config disables the pool", "[manager]") {
    ToolInspectionManager manager(InspectionConfig{.parallel = false, .thread_pool_size = 4});
    REQUIRE_FALSE(manager.is_parallel());
}

TEST_CASE("Inspector names are stable across calls", "[manager]") {
    ToolInspectionManager manager;
    REQUIRE(manager.add_inspector(std::make_unique<FixedInspector>("one", InspectionAction::allow())).is_ok());
    REQUIRE(manager.add_inspector(std::make_unique<FixedInspector>("two", InspectionAction::deny())).is_ok());

    auto before = manager.inspector_names();
    manager.inspect_tools(sample_batch(), {}, GovernanceMode::Approve);
    REQUIRE(manager.inspector_names() == before);
    REQUIRE(manager.inspector_names() == before);
}

TEST_CASE("Thrown exceptions are reported as failures", "[manager]") {
    ToolInspectionManager manager;
    REQUIRE(manager.add_inspector(std::make_unique<ThrowingInspector>()).is_ok());
    REQUIRE(manager.add_inspector(std::make_unique<FixedInspector>("ok", InspectionAction::deny())).is_ok());

    std::vector<std::string> failed;
    ErrorCode code = ErrorCode::Unknown;
    manager.set_failure_handler([&](std::string_view name, const Error& error) {
        failed.emplace_back(name);
        code = error.code;
    });

    auto results = manager.inspect_tools(sample_batch(), {}, GovernanceMode::Approve);

    REQUIRE(results.size() == 2);
    REQUIRE(results[0].action.is_deny());
    REQUIRE(failed == std::vector<std::string>{"throwing"});
    REQUIRE(code == ErrorCode::InspectorFailed);
}

TEST_CASE("Registration rejects null and duplicate names", "[manager]") {
    ToolInspectionManager manager;

    auto null_result = manager.add_inspector(nullptr);
    REQUIRE(null_result.is_err());
    REQUIRE(null_result.error().code == ErrorCode::InvalidArgument);

    REQUIRE(manager.add_inspector(std::make_unique<FixedInspector>("dup", InspectionAction::allow())).is_ok());
    auto dup = manager.add_inspector(std::make_unique<FixedInspector>("dup", InspectionAction::deny()));
    REQUIRE(dup.is_err());
    REQUIRE(dup.error().code == ErrorCode::AlreadyExists);
    REQUIRE(manager.size() == 1);
}

TEST_CASE("Disabled inspectors are skipped but listed", "[manager]") {
    ToolInspectionManager manager;
    auto disabled = std::make_unique<FixedInspector>("off", InspectionAction::deny(), false);
    auto* disabled_ptr = disabled.get();
    REQUIRE(manager.add_inspector(std::move(disabled)).is_ok());
    REQUIRE(manager.add_inspector(std::make_unique<FixedInspector>("on", InspectionAction::allow())).is_ok());

    auto results = manager.inspect_tools(sample_batch(), {}, GovernanceMode::Approve);

    REQUIRE(results.size() == 2);
    REQUIRE(results[0].inspector_name == "on");
    REQUIRE(disabled_ptr->calls.load() == 0);
    REQUIRE(manager.inspector_names() == std::vector<std::string>{"off", "on"});
}

TEST_CASE("Find inspectors by name and type", "[manager]") {
    ToolInspectionManager manager;
    REQUIRE(manager.add_inspector(std::make_unique<FixedInspector>("fixed", InspectionAction::allow())).is_ok());
    REQUIRE(manager.add_inspector(std::make_unique<RepetitionInspector>(3)).is_ok());

    REQUIRE(manager.find_inspector("fixed") != nullptr);
    REQUIRE(manager.find_inspector("missing") == nullptr);

    auto* repetition = manager.find_inspector<RepetitionInspector>();
    REQUIRE(repetition != nullptr);
    REQUIRE(repetition->max_repetitions() == 3);
}

TEST_CASE("Empty batch still runs every inspector", "[manager]") {
    ToolInspectionManager manager;
    auto fixed = std::make_unique<FixedInspector>("fixed", InspectionAction::allow());
    auto* fixed_ptr = fixed.get();
    REQUIRE(manager.add_inspector(std::move(fixed)).is_ok());

    REQUIRE(manager.inspect_tools({}, {}, GovernanceMode::Approve).empty());
    REQUIRE(fixed_ptr->calls.load() == 1);
}

TEST_CASE("Unknown request ids are detectable", "[manager]") {
    std::vector<InspectionResult> results{
        InspectionResult{.tool_request_id = "req_1", .inspector_name = "a"},
        InspectionResult{.tool_request_id = "ghost", .inspector_name = "a"}
    };

    REQUIRE(unknown_request_ids(results, sample_batch()) == std::vector<ToolRequestId>{"ghost"});
}
