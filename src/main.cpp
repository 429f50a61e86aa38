#include "toolgov/core/config.hpp"
#include "toolgov/core/logging.hpp"
#include "toolgov/governance/bootstrap.hpp"
#include "toolgov/permission/permission_check.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

using namespace toolgov;

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config PATH] [BATCH_FILE]\n"
              << "\n"
              << "Reads a JSON batch, or an array of batches, from BATCH_FILE or stdin:\n"
              << "  {\"mode\": \"approve\", \"tool_requests\": [...], \"messages\": [...],\n"
              << "   \"confirmations\": {\"<request id>\": {\"principal_type\": \"tool\",\n"
              << "                                         \"permission\": \"always_allow\"}}}\n"
              << "and prints one JSON line of verdicts per batch.\n";
}

core::Result<core::Json, core::Error> read_input(const std::string& path) {
    std::string text;
    if (path.empty() || path == "-") {
        text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        std::ifstream file(path);
        if (!file) {
            return core::Result<core::Json, core::Error>::err(
                core::ErrorCode::FileReadFailed, "Cannot open batch file", path);
        }
        text.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    auto parsed = core::Json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return core::Result<core::Json, core::Error>::err(
            core::ErrorCode::InvalidArgument, "Batch input is not valid JSON", path);
    }
    return core::Result<core::Json, core::Error>::ok(std::move(parsed));
}

core::Json run_batch(inspection::ToolInspectionManager& manager,
                     const core::Json& batch,
                     core::GovernanceMode default_mode,
                     size_t index,
                     bool& permissions_changed) {
    if (!batch.is_object()) {
        spdlog::warn("Batch {}: expected an object, got {}", index, batch.type_name());
        return core::Json{{"batch", index}, {"error", "batch must be a JSON object"}};
    }

    auto mode = default_mode;
    if (batch.contains("mode")) {
        auto parsed = core::governance_mode_from_string(core::string_field(batch, "mode"));
        if (parsed) {
            mode = *parsed;
        } else {
            spdlog::warn("Batch {}: unknown mode {}, using {}", index,
                batch["mode"].dump(), core::governance_mode_to_string(default_mode));
        }
    }

    std::vector<core::ToolRequest> requests;
    auto request_list = batch.value("tool_requests", core::Json::array());
    if (!request_list.is_array()) {
        spdlog::warn("Batch {}: tool_requests is not an array, ignoring it", index);
        request_list = core::Json::array();
    }
    for (const auto& item : request_list) {
        requests.push_back(core::ToolRequest::from_json(item));
    }

    std::vector<core::Message> messages;
    auto message_list = batch.value("messages", core::Json::array());
    if (!message_list.is_array()) {
        spdlog::warn("Batch {}: messages is not an array, ignoring it", index);
        message_list = core::Json::array();
    }
    for (const auto& item : message_list) {
        messages.push_back(core::Message::from_json(item));
    }

    auto results = manager.inspect_tools(requests, messages, mode);

    core::Json out{
        {"batch", index},
        {"mode", std::string(core::governance_mode_to_string(mode))},
        {"results", core::Json::array()},
        {"resolved", permission::resolve_inspection_results(requests, results).to_json()}
    };
    for (const auto& result : results) {
        out["results"].push_back(result.to_json());
    }

    auto permission_view = governance::process_inspection_results_with_permission_inspector(
        manager, requests, results);
    if (permission_view) {
        out["permission_check"] = permission_view->to_json();
    }

    if (batch.contains("confirmations") && batch["confirmations"].is_object()) {
        for (const auto& item : batch["confirmations"].items()) {
            const std::string request_id = item.key();
            auto confirmation = permission::PermissionConfirmation::from_json(item.value());
            if (confirmation.is_err()) {
                spdlog::warn("Batch {}: ignoring confirmation for {}: {}", index, request_id,
                    confirmation.error().full_message());
                continue;
            }

            auto it = std::find_if(requests.begin(), requests.end(),
                [&request_id](const core::ToolRequest& r) { return r.id == request_id; });
            if (it == requests.end()) {
                spdlog::warn("Batch {}: confirmation for unknown request {}", index, request_id);
                continue;
            }

            if (governance::record_confirmation(manager, *it, confirmation.value())) {
                permissions_changed = true;
            }
        }
    }

    return out;
}

}  // namespace

int main(int argc, char* argv[]) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("toolgov"));

    core::fs::path config_path = core::Config::default_path();
    std::string batch_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (batch_path.empty()) {
            batch_path = arg;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    auto loaded = core::Config::load(config_path);
    core::Config config;
    if (loaded.is_ok()) {
        config = std::move(loaded).value();
    } else if (loaded.error().code == core::ErrorCode::ConfigNotFound) {
        config = core::Config::load_or_default(config_path);
    } else {
        spdlog::error("Configuration error: {}", loaded.error().to_string());
        return 1;
    }

    auto logging = core::configure_logging(config.observability);
    if (logging.is_err()) {
        spdlog::warn("File logging disabled: {}", logging.error().to_string());
    }

    auto permission_manager = std::make_shared<permission::PermissionManager>();
    auto store = permission::PermissionManager::load(config.permissions.store_path);
    if (store.is_ok()) {
        *permission_manager = std::move(store).value();
    } else if (store.error().code != core::ErrorCode::FileNotFound) {
        spdlog::warn("Ignoring permission store: {}", store.error().to_string());
    }

    auto manager = governance::make_inspection_manager(config, permission_manager);

    auto input = read_input(batch_path);
    if (input.is_err()) {
        spdlog::error("{}", input.error().to_string());
        return 1;
    }

    const auto& json = input.value();
    core::Json batches = json.is_array() ? json : core::Json::array({json});

    bool permissions_changed = false;
    for (size_t i = 0; i < batches.size(); ++i) {
        core::Json out;
        try {
            out = run_batch(*manager, batches[i], config.governance.mode, i, permissions_changed);
        } catch (const core::Json::exception& e) {
            spdlog::error("Batch {}: malformed input: {}", i, e.what());
            out = core::Json{{"batch", i}, {"error", e.what()}};
        }
        std::cout << out.dump() << std::endl;
    }

    if (permissions_changed) {
        auto saved = permission_manager->save(config.permissions.store_path);
        if (saved.is_err()) {
            spdlog::error("Failed to persist permissions: {}", saved.error().to_string());
            return 1;
        }
        spdlog::info("Saved standing permissions to {}", config.permissions.store_path.string());
    }

    return 0;
}
