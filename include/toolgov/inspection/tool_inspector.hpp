#pragma once

#include "toolgov/core/result.hpp"
#include "toolgov/core/types.hpp"
#include "inspection_result.hpp"

#include <string_view>
#include <vector>

namespace toolgov::inspection {

using namespace toolgov::core;

using InspectionResults = std::vector<InspectionResult>;

// A pluggable policy unit. Given the pending tool requests of one batch, the
// conversation so far and the governance mode, it returns zero or more
// verdicts or fails as a whole. Inspectors never modify their inputs.
//
// Stateless inspectors must tolerate concurrent calls from different batches.
// Stateful ones serialize internally.
//
// Concrete types are recovered from a ToolInspector& with dynamic_cast, see
// ToolInspectionManager::find_inspector<T>().
class ToolInspector {
public:
    virtual ~ToolInspector() = default;

    // Stable, unique identifier used for attribution and lookup
    virtual std::string_view name() const = 0;

    virtual Result<InspectionResults, Error> inspect(
        const std::vector<ToolRequest>& tool_requests,
        const std::vector<Message>& messages,
        GovernanceMode mode) = 0;

    // Disabled inspectors are skipped for a batch but stay registered
    virtual bool is_enabled() const { return true; }
};

}  // namespace toolgov::inspection
