#include "types.h"

namespace stepcoach {

std::string executionStatusToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::IDLE: return "idle";
        case ExecutionStatus::PLANNING: return "planning";
        case ExecutionStatus::PENDING: return "pending";
        case ExecutionStatus::WAITING_FOR_COMPLETION: return "waiting_for_completion";
        case ExecutionStatus::VERIFYING: return "verifying";
        case ExecutionStatus::REPLANNING: return "replanning";
        case ExecutionStatus::COMPLETED: return "completed";
        case ExecutionStatus::FAILED: return "failed";
    }
    return "unknown";
}

std::string runOutcomeToString(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::COMPLETED: return "completed";
        case RunOutcome::PLAN_EMPTY: return "plan_empty";
        case RunOutcome::GOAL_UNREACHABLE: return "goal_unreachable";
        case RunOutcome::CANCELLED: return "cancelled";
        case RunOutcome::INTERNAL_ERROR: return "internal_error";
    }
    return "unknown";
}

nlohmann::json RunStatistics::toJson() const {
    return nlohmann::json{
        {"announcements", announcements},
        {"waits", waits},
        {"idle_timeouts", idleTimeouts},
        {"signals_received", signalsReceived},
        {"advances", advances},
        {"retries", retries},
        {"replans", replans},
        {"dynamic_effects", dynamicEffects},
        {"rechecks", rechecks},
        {"loading_polls", loadingPolls},
        {"goal_checks", goalChecks},
        {"oracle_failures", oracleFailures}
    };
}

nlohmann::json RunResult::toJson() const {
    return nlohmann::json{
        {"outcome", runOutcomeToString(outcome)},
        {"success", success},
        {"message", message},
        {"statistics", statistics.toJson()},
        {"completed_steps", completedSteps},
        {"elapsed_ms", elapsed.count()}
    };
}

} // namespace stepcoach
