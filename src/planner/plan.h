#ifndef STEPCOACH_PLAN_H
#define STEPCOACH_PLAN_H

#include "../grammar/action_grammar.h"
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace stepcoach {

// What the user wants to achieve; read-only to the engine
struct Intent {
    std::string goal;
    std::optional<std::string> targetApp;
    std::optional<std::string> targetState;
    std::vector<std::string> successCriteria;

    Intent() = default;
    explicit Intent(const std::string& goalText) : goal(goalText) {}

    nlohmann::json toJson() const;
};

struct Step {
    int number;
    Skill skill;
    std::string instruction;
    std::string expectedResult;
    std::string errorRecoveryHint;
    std::string visualHint;

    Step(int stepNumber, const Skill& stepSkill, const std::string& instructionText)
        : number(stepNumber), skill(stepSkill), instruction(instructionText) {}

    /**
     * @brief Instruction text, or the skill rendering if the planner gave none
     */
    std::string describe() const;

    nlohmann::json toJson() const;
};

/**
 * @brief Ordered steps numbered 1..n, plus the intent they serve
 *
 * An empty plan means the planner found no path.
 */
struct Plan {
    std::vector<Step> steps;
    Intent intent;
    std::vector<std::string> knowledgeSources;

    bool isEmpty() const { return steps.empty(); }
    size_t size() const { return steps.size(); }
    bool startsWithDone() const { return !steps.empty() && steps.front().skill.isDone(); }

    /**
     * @brief True when step numbers run 1, 2, ... n without gaps
     */
    bool isDenselyNumbered() const;
    void renumber();

    nlohmann::json toJson() const;
};

} // namespace stepcoach

#endif // STEPCOACH_PLAN_H
