#ifndef STEPCOACH_TYPES_H
#define STEPCOACH_TYPES_H

#include <string>
#include <vector>
#include <chrono>
#include <nlohmann/json.hpp>

namespace stepcoach {

// Per-step and whole-run states of the execution engine
enum class ExecutionStatus {
    IDLE,
    PLANNING,
    PENDING,
    WAITING_FOR_COMPLETION,
    VERIFYING,
    REPLANNING,
    COMPLETED,
    FAILED
};

// Terminal outcome of one run
enum class RunOutcome {
    COMPLETED,
    PLAN_EMPTY,
    GOAL_UNREACHABLE,
    CANCELLED,
    INTERNAL_ERROR
};

std::string executionStatusToString(ExecutionStatus status);
std::string runOutcomeToString(RunOutcome outcome);

struct RunStatistics {
    int announcements = 0;
    int waits = 0;
    int idleTimeouts = 0;
    int signalsReceived = 0;
    int advances = 0;
    int retries = 0;
    int replans = 0;
    int dynamicEffects = 0;
    int rechecks = 0;
    int loadingPolls = 0;
    int goalChecks = 0;
    int oracleFailures = 0;

    nlohmann::json toJson() const;
};

// Result of one run
struct RunResult {
    RunOutcome outcome;
    bool success;
    std::string message;
    RunStatistics statistics;
    std::vector<std::string> completedSteps;
    std::chrono::milliseconds elapsed;

    RunResult() : outcome(RunOutcome::INTERNAL_ERROR), success(false), elapsed(0) {}

    nlohmann::json toJson() const;
};

} // namespace stepcoach

#endif // STEPCOACH_TYPES_H
