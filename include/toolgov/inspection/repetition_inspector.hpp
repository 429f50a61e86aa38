#pragma once

#include "tool_inspector.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace toolgov::inspection {

// Threshold used when the embedder does not configure one
inline constexpr uint32_t kDefaultMaxRepetitions = 5;

inline constexpr std::string_view kRepetitionInspectorName = "repetition";
inline constexpr std::string_view kRepetitionFindingId = "REP-001";

// Cuts off a model that keeps issuing the same tool call. Calls are compared
// by (tool name, canonical argument encoding); up to max_repetitions
// consecutive identical calls are allowed, every further one is denied until
// a different call comes in.
//
// State lives for the whole inspector lifetime and is fed in the order calls
// are attempted, so one instance must only ever see one session's calls.
class RepetitionInspector : public ToolInspector {
public:
    explicit RepetitionInspector(std::optional<uint32_t> max_repetitions = std::nullopt);

    std::string_view name() const override { return kRepetitionInspectorName; }

    // Feeds every request through check_tool_call() in order and emits one
    // Allow or Deny result per request
    Result<InspectionResults, Error> inspect(
        const std::vector<ToolRequest>& tool_requests,
        const std::vector<Message>& messages,
        GovernanceMode mode) override;

    // Record one attempted call; true if it is allowed
    bool check_tool_call(const std::string& tool_name, const Json& arguments);
    bool check_tool_call(const ToolRequest& request) {
        return check_tool_call(request.tool_name, request.arguments);
    }

    uint32_t max_repetitions() const;
    void set_max_repetitions(uint32_t max_repetitions);

    uint32_t consecutive_count() const;

    // Lifetime number of calls seen for a tool, identical or not
    uint32_t total_calls(const std::string& tool_name) const;

    // Forget all history. Only the embedder calls this.
    void reset();

private:
    using Signature = std::pair<std::string, std::string>;

    bool check_locked(const std::string& tool_name, const Json& arguments);

    mutable std::mutex mutex_;
    uint32_t max_repetitions_;
    std::optional<Signature> last_signature_;
    uint32_t consecutive_count_ = 0;
    std::unordered_map<std::string, uint32_t> call_counts_;
};

}  // namespace toolgov::inspection
