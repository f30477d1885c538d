#ifndef STEPCOACH_GOAL_EVALUATOR_H
#define STEPCOACH_GOAL_EVALUATOR_H

#include "../environmental_perception/environmental_perception.h"
#include "../planner/plan.h"
#include "../planner/prompt_library.h"
#include "../oracle/oracle.h"
#include <string>
#include <memory>

namespace stepcoach {

struct GoalVerdict {
    bool achieved;
    std::string reason;
    bool oracleFailed;

    GoalVerdict() : achieved(false), oracleFailed(false) {}
};

/**
 * @brief Judges whether the whole intent is satisfied, independent of plan progress
 */
class IGoalEvaluator {
public:
    virtual ~IGoalEvaluator() = default;
    virtual GoalVerdict evaluate(const Intent& intent, const Snapshot& snapshot) = 0;
};

class GoalEvaluator : public IGoalEvaluator {
public:
    explicit GoalEvaluator(std::shared_ptr<IOracle> oracle, const PromptLibrary& prompts = PromptLibrary());

    GoalVerdict evaluate(const Intent& intent, const Snapshot& snapshot) override;

private:
    std::shared_ptr<IOracle> m_oracle;
    PromptLibrary m_prompts;
};

} // namespace stepcoach

#endif // STEPCOACH_GOAL_EVALUATOR_H
