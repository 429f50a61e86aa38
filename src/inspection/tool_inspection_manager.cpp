#include "toolgov/inspection/tool_inspection_manager.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <unordered_set>

namespace toolgov::inspection {

ToolInspectionManager::ToolInspectionManager() = default;

ToolInspectionManager::ToolInspectionManager(const InspectionConfig& config) {
    if (config.parallel) {
        pool_ = std::make_unique<ThreadPool>(static_cast<size_t>(std::max(config.thread_pool_size, 1)));
    }
}

ToolInspectionManager::~ToolInspectionManager() {
    if (pool_) {
        pool_->shutdown();
    }
}

Result<void, Error> ToolInspectionManager::add_inspector(std::unique_ptr<ToolInspector> inspector) {
    if (!inspector) {
        return Result<void, Error>::err(
            ErrorCode::InvalidArgument,
            "Cannot register a null inspector"
        );
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::string name(inspector->name());
    for (const auto& existing : inspectors_) {
        if (existing->name() == name) {
            return Result<void, Error>::err(
                ErrorCode::AlreadyExists,
                "Inspector already registered",
                name
            );
        }
    }

    inspectors_.push_back(std::move(inspector));
    spdlog::debug("Registered tool inspector {} (position {})", name, inspectors_.size());
    return Result<void, Error>::ok();
}

Result<InspectionResults, Error> ToolInspectionManager::run_inspector(
    ToolInspector& inspector,
    const std::vector<ToolRequest>& tool_requests,
    const std::vector<Message>& messages,
    GovernanceMode mode) const {

    spdlog::debug("Running tool inspector {} on {} tool requests",
        inspector.name(), tool_requests.size());

    try {
        return inspector.inspect(tool_requests, messages, mode);
    } catch (const std::exception& e) {
        return Result<InspectionResults, Error>::err(
            ErrorCode::InspectorFailed,
            e.what(),
            std::string(inspector.name())
        );
    } catch (...) {
        return Result<InspectionResults, Error>::err(
            ErrorCode::InspectorFailed,
            "Inspector threw a non-standard exception",
            std::string(inspector.name())
        );
    }
}

void ToolInspectionManager::report_failure(std::string_view inspector_name, const Error& error) const {
    spdlog::error("Tool inspector {} failed: {}", inspector_name, error.to_string());

    InspectorFailureHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = failure_handler_;
    }
    if (handler) {
        handler(inspector_name, error);
    }
}

std::vector<InspectionResult> ToolInspectionManager::inspect_tools(
    const std::vector<ToolRequest>& tool_requests,
    const std::vector<Message>& messages,
    GovernanceMode mode) {

    std::vector<ToolInspector*> active;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& inspector : inspectors_) {
            if (inspector->is_enabled()) {
                active.push_back(inspector.get());
            } else {
                spdlog::debug("Skipping disabled tool inspector {}", inspector->name());
            }
        }
    }

    // One outcome slot per active inspector, filled in registration order
    std::vector<Result<InspectionResults, Error>> outcomes;
    outcomes.reserve(active.size());

    if (pool_ && active.size() > 1) {
        std::vector<std::future<Result<InspectionResults, Error>>> futures;
        futures.reserve(active.size());

        for (auto* inspector : active) {
            try {
                futures.push_back(pool_->submit([this, inspector, &tool_requests, &messages, mode]() {
                    return run_inspector(*inspector, tool_requests, messages, mode);
                }));
            } catch (const std::exception& e) {
                std::promise<Result<InspectionResults, Error>> failed;
                failed.set_value(Result<InspectionResults, Error>::err(
                    ErrorCode::InspectorPoolStopped, e.what(), std::string(inspector->name())));
                futures.push_back(failed.get_future());
            }
        }

        for (auto& future : futures) {
            outcomes.push_back(future.get());
        }
    } else {
        for (auto* inspector : active) {
            outcomes.push_back(run_inspector(*inspector, tool_requests, messages, mode));
        }
    }

    std::vector<InspectionResult> all_results;

    for (size_t i = 0; i < active.size(); ++i) {
        auto& outcome = outcomes[i];
        if (outcome.is_err()) {
            report_failure(active[i]->name(), outcome.error());
            continue;
        }

        auto& results = outcome.value();
        spdlog::debug("Tool inspector {} completed with {} results",
            active[i]->name(), results.size());
        all_results.insert(all_results.end(),
            std::make_move_iterator(results.begin()),
            std::make_move_iterator(results.end()));
    }

    return all_results;
}

std::vector<std::string> ToolInspectionManager::inspector_names() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    names.reserve(inspectors_.size());
    for (const auto& inspector : inspectors_) {
        names.emplace_back(inspector->name());
    }
    return names;
}

size_t ToolInspectionManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inspectors_.size();
}

ToolInspector* ToolInspectionManager::find_inspector(std::string_view name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& inspector : inspectors_) {
        if (inspector->name() == name) {
            return inspector.get();
        }
    }
    return nullptr;
}

void ToolInspectionManager::set_failure_handler(InspectorFailureHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_handler_ = std::move(handler);
}

std::vector<ToolRequestId> unknown_request_ids(
    const std::vector<InspectionResult>& results,
    const std::vector<ToolRequest>& tool_requests) {

    std::unordered_set<ToolRequestId> known;
    for (const auto& request : tool_requests) {
        known.insert(request.id);
    }

    std::vector<ToolRequestId> unknown;
    for (const auto& result : results) {
        if (!known.count(result.tool_request_id)) {
            unknown.push_back(result.tool_request_id);
        }
    }
    return unknown;
}

}  // namespace toolgov::inspection
