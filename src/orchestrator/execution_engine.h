#ifndef STEPCOACH_EXECUTION_ENGINE_H
#define STEPCOACH_EXECUTION_ENGINE_H

#include <memory>
#include <string>
#include <optional>
#include <atomic>
#include <mutex>
#include <functional>
#include "../common/types.h"
#include "../common/clock.h"
#include "../common/config_manager.h"
#include "../planner/planner.h"
#include "../feedback/change_observer.h"
#include "../feedback/goal_evaluator.h"
#include "../input/input_event_source.h"
#include "execution_context.h"
#include "presentation.h"
#include "safety_advisor.h"

namespace stepcoach {

/**
 * @brief Collaborators of the engine, fixed for its lifetime
 */
struct EngineDependencies {
    std::shared_ptr<IPlanner> planner;
    std::shared_ptr<IPerception> perception;
    std::shared_ptr<IChangeObserver> changeObserver;
    std::shared_ptr<IGoalEvaluator> goalEvaluator;
    std::shared_ptr<IInputEventSource> inputSource;
    std::shared_ptr<IClock> clock;
    PresentationCallbacks callbacks;

    /**
     * @brief Throws CONFIGURATION_ERROR naming the first missing collaborator
     */
    void validate() const;
};

struct EngineProgress {
    ExecutionStatus status;
    int currentStep;    // 1-based, 0 when no step is active
    int totalSteps;
    int replanCount;

    EngineProgress() : status(ExecutionStatus::IDLE), currentStep(0), totalSteps(0), replanCount(0) {}
};

/**
 * @class ExecutionEngine
 * @brief Closed-loop execution of a plan against a live screen
 *
 * Each step is announced, then the engine waits for a completion signal,
 * captures the screen and decides whether to advance, retry the step,
 * replan, or finish. Budgets come from EngineConfig. One run at a time;
 * cancel() and submitUserFeedback() may be called from any thread.
 */
class ExecutionEngine {
public:
    ExecutionEngine(const EngineDependencies& dependencies, const EngineConfig& config);
    ~ExecutionEngine();

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    /**
     * @brief Observe the screen, plan for the intent and execute the plan
     */
    RunResult run(const Intent& intent, const std::string& knowledgeContext = "");

    /**
     * @brief Execute an already built plan; its intent is used for goal checks and replans
     */
    RunResult execute(const Plan& plan);

    /**
     * @brief Stop the current run at the next wait; no further oracle calls are made
     */
    void cancel();

    /**
     * @brief Free-text correction from the user; forces a replan of the current run
     */
    void submitUserFeedback(const std::string& feedback);

    bool isRunning() const;
    EngineProgress getProgress() const;
    std::optional<Step> getCurrentStep() const;
    const EngineConfig& getConfig() const { return m_config; }

private:
    enum class StepDecision {
        ADVANCE,
        RETRY,
        REPLAN,
        GOAL_REACHED,
        CANCELLED
    };

    struct StepOutcome {
        StepDecision decision;
        std::string reason;
    };

    const EngineDependencies m_dependencies;
    const EngineConfig m_config;
    Presenter m_presenter;
    SafetyAdvisor m_safety;

    std::atomic<bool> m_running;
    std::atomic<bool> m_cancelRequested;

    std::mutex m_feedbackMutex;
    std::optional<std::string> m_pendingFeedback;

    mutable std::mutex m_progressMutex;
    EngineProgress m_progress;
    std::optional<Step> m_currentStep;

    RunResult guardedRun(ExecutionContext& context, const std::function<RunResult()>& body);
    RunResult executeLoop(ExecutionContext& context);

    // Per-step phases
    void announceStep(ExecutionContext& context, const Step& step);
    StepOutcome awaitAndVerify(ExecutionContext& context, const Step& step);
    StepOutcome judgeChanged(ExecutionContext& context, const Step& step, const Snapshot& after);
    StepOutcome stepFailed(ExecutionContext& context, const std::string& reason);
    ChangeJudgment waitWhileLoading(ExecutionContext& context, Snapshot& after);
    std::optional<RunResult> replan(ExecutionContext& context, const std::string& reason);

    std::optional<Snapshot> captureSnapshot(ExecutionContext& context, const std::string& purpose);
    std::optional<std::string> takeFeedback();
    bool cancelRequested() const { return m_cancelRequested.load(); }

    void setStatus(ExecutionContext& context, ExecutionStatus status);
    void publishStep(ExecutionContext& context);
    RunResult finish(ExecutionContext& context, RunOutcome outcome, const std::string& message);
    std::string renderHelpPrompt(const Step& step) const;
    std::chrono::milliseconds remainingIdle(const ExecutionContext& context) const;
};

} // namespace stepcoach

#endif // STEPCOACH_EXECUTION_ENGINE_H
