#ifndef STEPCOACH_CHANGE_OBSERVER_H
#define STEPCOACH_CHANGE_OBSERVER_H

#include "../environmental_perception/environmental_perception.h"
#include "../planner/plan.h"
#include "../planner/prompt_library.h"
#include "../oracle/oracle.h"
#include <string>
#include <vector>
#include <memory>

namespace stepcoach {

enum class ChangeClassification {
    LOADING,
    ERROR,
    UNCHANGED,
    CHANGED
};

enum class UnchangedCause {
    USER_ACTION,
    DYNAMIC_EFFECT,
    NONE
};

std::string changeClassificationToString(ChangeClassification classification);
std::string unchangedCauseToString(UnchangedCause cause);

struct ChangeJudgment {
    ChangeClassification classification;
    std::string justification;
};

struct CauseJudgment {
    UnchangedCause cause;
    std::string justification;
    bool oracleFailed;

    CauseJudgment() : cause(UnchangedCause::NONE), oracleFailed(false) {}
};

struct StepVerdict {
    bool success;
    std::string changes;
    std::string reason;
    bool oracleFailed;

    StepVerdict() : success(false), oracleFailed(false) {}
};

/**
 * @brief Judges what happened on screen between two snapshots
 *
 * Any judgment may be wrong; callers bound the cost of a wrong answer with
 * retry and replan budgets.
 */
class IChangeObserver {
public:
    virtual ~IChangeObserver() = default;

    virtual ChangeJudgment classify(const Snapshot& before, const Snapshot& after) = 0;
    virtual CauseJudgment unchangedCause(const Step& step, const Snapshot& before, const Snapshot& after) = 0;
    virtual StepVerdict verifyStep(const Step& step, const Snapshot& before, const Snapshot& after) = 0;
};

/**
 * @brief Keyword and state-identity classification, oracle-backed cause and step checks
 */
class ChangeObserver : public IChangeObserver {
public:
    explicit ChangeObserver(std::shared_ptr<IOracle> oracle, const PromptLibrary& prompts = PromptLibrary());

    ChangeJudgment classify(const Snapshot& before, const Snapshot& after) override;
    CauseJudgment unchangedCause(const Step& step, const Snapshot& before, const Snapshot& after) override;
    StepVerdict verifyStep(const Step& step, const Snapshot& before, const Snapshot& after) override;

    /**
     * @brief The deterministic part of classify(), on analysed screen states only
     */
    static ChangeJudgment classifyStates(const ScreenState& before, const ScreenState& after);

    static const std::vector<std::string>& loadingKeywords();
    static const std::vector<std::string>& errorKeywords();

private:
    std::shared_ptr<IOracle> m_oracle;
    PromptLibrary m_prompts;

    static void attachImages(OracleRequest& request, const Snapshot& before, const Snapshot& after);
};

} // namespace stepcoach

#endif // STEPCOACH_CHANGE_OBSERVER_H
