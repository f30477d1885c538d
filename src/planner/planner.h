#ifndef STEPCOACH_PLANNER_H
#define STEPCOACH_PLANNER_H

#include "plan.h"
#include "plan_parser.h"
#include "prompt_library.h"
#include "../oracle/oracle.h"
#include "../environmental_perception/environmental_perception.h"
#include <string>
#include <vector>
#include <memory>
#include <mutex>

namespace stepcoach {

struct ReplanRequest {
    Intent intent;
    std::vector<std::string> completedSteps;   // descriptions, in execution order
    std::string failureReason;
};

/**
 * @brief Produces plans; stateless across calls
 *
 * An empty plan means no feasible path was found.
 */
class IPlanner {
public:
    virtual ~IPlanner() = default;

    virtual Plan createPlan(const Intent& intent, const ScreenState& screen,
                            const std::string& knowledgeContext) = 0;
    virtual Plan replan(const ReplanRequest& request, const ScreenState& screen) = 0;
};

/**
 * @brief Planner that issues exactly one oracle call per request
 */
class Planner : public IPlanner {
public:
    explicit Planner(std::shared_ptr<IOracle> oracle, const PromptLibrary& prompts = PromptLibrary());

    Plan createPlan(const Intent& intent, const ScreenState& screen,
                    const std::string& knowledgeContext) override;
    Plan replan(const ReplanRequest& request, const ScreenState& screen) override;

    std::string buildPlanningPrompt(const Intent& intent, const ScreenState& screen,
                                    const std::string& knowledgeContext) const;
    std::string buildReplanPrompt(const ReplanRequest& request, const ScreenState& screen) const;

    PlanParseReport getLastReport() const;

private:
    std::shared_ptr<IOracle> m_oracle;
    PromptLibrary m_prompts;

    mutable std::mutex m_reportMutex;
    PlanParseReport m_lastReport;

    Plan requestPlan(const std::string& purpose, const std::string& prompt, const Intent& intent);
};

} // namespace stepcoach

#endif // STEPCOACH_PLANNER_H
