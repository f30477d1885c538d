#ifndef STEPCOACH_EXECUTION_CONTEXT_H
#define STEPCOACH_EXECUTION_CONTEXT_H

#include "../common/types.h"
#include "../common/clock.h"
#include "../planner/plan.h"
#include "../environmental_perception/environmental_perception.h"
#include <string>
#include <vector>
#include <optional>

namespace stepcoach {

/**
 * @brief Mutable state of one run, owned by the engine loop
 *
 * Created when a run starts and discarded when it ends; nothing carries over
 * between runs.
 */
struct ExecutionContext {
    std::string runId;
    Intent intent;
    Plan plan;
    size_t cursor;
    int stepRetries;
    int replanCount;
    std::optional<Snapshot> before;
    IClock::TimePoint idleSince;
    IClock::TimePoint startedAt;
    std::vector<std::string> completedSteps;
    ExecutionStatus status;
    RunStatistics statistics;

    ExecutionContext() : cursor(0), stepRetries(0), replanCount(0), status(ExecutionStatus::IDLE) {}

    bool hasCurrentStep() const { return cursor < plan.steps.size(); }
    const Step& currentStep() const { return plan.steps.at(cursor); }
};

} // namespace stepcoach

#endif // STEPCOACH_EXECUTION_CONTEXT_H
