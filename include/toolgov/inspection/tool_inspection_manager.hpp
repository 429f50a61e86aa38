#pragma once

#include "toolgov/core/config.hpp"
#include "toolgov/core/result.hpp"
#include "thread_pool.hpp"
#include "tool_inspector.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace toolgov::inspection {

using namespace toolgov::core;

// Out-of-band report of an inspector that failed on a batch
using InspectorFailureHandler = std::function<void(std::string_view inspector_name, const Error& error)>;

// Owns an ordered registry of inspectors and runs a batch of tool requests
// through all of them. Registration order is the reporting order.
//
// A failing inspector contributes nothing to the batch; the failure is logged
// and handed to the failure handler, never returned to the caller. Results
// are concatenated as-is: no deduplication, no reconciliation of conflicting
// verdicts (see permission::resolve_inspection_results for that).
//
// At most one inspect_tools() call per session may be in flight, since
// stateful inspectors need calls in chronological order.
class ToolInspectionManager {
public:
    // Runs inspectors one after another on the calling thread
    ToolInspectionManager();

    // Runs inspectors on a worker pool when config.parallel is set
    explicit ToolInspectionManager(const InspectionConfig& config);

    ~ToolInspectionManager();

    ToolInspectionManager(const ToolInspectionManager&) = delete;
    ToolInspectionManager& operator=(const ToolInspectionManager&) = delete;

    // Append an inspector. Rejects null and names already registered.
    Result<void, Error> add_inspector(std::unique_ptr<ToolInspector> inspector);

    std::vector<InspectionResult> inspect_tools(
        const std::vector<ToolRequest>& tool_requests,
        const std::vector<Message>& messages,
        GovernanceMode mode);

    // Every registered name in registration order, failed or not
    std::vector<std::string> inspector_names() const;

    size_t size() const;

    ToolInspector* find_inspector(std::string_view name) const;

    // First registered inspector of concrete type T
    template<typename T>
    T* find_inspector() const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& inspector : inspectors_) {
            if (auto* typed = dynamic_cast<T*>(inspector.get())) {
                return typed;
            }
        }
        return nullptr;
    }

    void set_failure_handler(InspectorFailureHandler handler);

    bool is_parallel() const { return pool_ != nullptr; }

private:
    Result<InspectionResults, Error> run_inspector(
        ToolInspector& inspector,
        const std::vector<ToolRequest>& tool_requests,
        const std::vector<Message>& messages,
        GovernanceMode mode) const;

    void report_failure(std::string_view inspector_name, const Error& error) const;

    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<ToolInspector>> inspectors_;
    std::unique_ptr<ThreadPool> pool_;
    InspectorFailureHandler failure_handler_;
};

// Ids in results that do not belong to the batch. Meant for tests and
// diagnostics, not for the per-batch path.
std::vector<ToolRequestId> unknown_request_ids(
    const std::vector<InspectionResult>& results,
    const std::vector<ToolRequest>& tool_requests);

}  // namespace toolgov::inspection
