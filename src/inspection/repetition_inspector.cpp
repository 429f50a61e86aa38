#include "toolgov/inspection/repetition_inspector.hpp"
#include "toolgov/inspection/canonical_json.hpp"

#include <spdlog/spdlog.h>

#include <limits>

namespace toolgov::inspection {

RepetitionInspector::RepetitionInspector(std::optional<uint32_t> max_repetitions)
    : max_repetitions_(max_repetitions.value_or(kDefaultMaxRepetitions))
{
}

bool RepetitionInspector::check_tool_call(const std::string& tool_name, const Json& arguments) {
    std::lock_guard<std::mutex> lock(mutex_);
    return check_locked(tool_name, arguments);
}

bool RepetitionInspector::check_locked(const std::string& tool_name, const Json& arguments) {
    ++call_counts_[tool_name];

    Signature signature{tool_name, canonical_encoding(arguments)};

    if (last_signature_ && *last_signature_ == signature) {
        if (consecutive_count_ < std::numeric_limits<uint32_t>::max()) {
            ++consecutive_count_;
        }
    } else {
        last_signature_ = std::move(signature);
        consecutive_count_ = 1;
    }

    return consecutive_count_ <= max_repetitions_;
}

Result<InspectionResults, Error> RepetitionInspector::inspect(
    const std::vector<ToolRequest>& tool_requests,
    const std::vector<Message>& /*messages*/,
    GovernanceMode /*mode*/) {

    InspectionResults results;
    results.reserve(tool_requests.size());

    // Hold the lock across the batch so no other batch interleaves
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& request : tool_requests) {
        bool allowed = check_locked(request.tool_name, request.arguments);

        InspectionResult result{
            .tool_request_id = request.id,
            .action = allowed ? InspectionAction::allow() : InspectionAction::deny(),
            .reason = allowed
                ? "Tool '" + request.tool_name + "' is within the repetition limit ("
                    + std::to_string(consecutive_count_) + "/" + std::to_string(max_repetitions_) + ")"
                : "Tool '" + request.tool_name + "' has exceeded maximum repetitions",
            .confidence = 1.0f,
            .inspector_name = std::string(kRepetitionInspectorName),
            .finding_id = allowed ? std::nullopt
                                  : std::optional<std::string>(std::string(kRepetitionFindingId))
        };

        if (!allowed) {
            spdlog::warn("Repetition limit hit: tool={} consecutive={} max={}",
                request.tool_name, consecutive_count_, max_repetitions_);
        }

        results.push_back(std::move(result));
    }

    return Result<InspectionResults, Error>::ok(std::move(results));
}

uint32_t RepetitionInspector::max_repetitions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_repetitions_;
}

void RepetitionInspector::set_max_repetitions(uint32_t max_repetitions) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_repetitions_ = max_repetitions;
}

uint32_t RepetitionInspector::consecutive_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_count_;
}

uint32_t RepetitionInspector::total_calls(const std::string& tool_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = call_counts_.find(tool_name);
    return it == call_counts_.end() ? 0 : it->second;
}

void RepetitionInspector::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_signature_.reset();
    consecutive_count_ = 0;
    call_counts_.clear();
}

}  // namespace toolgov::inspection
