#ifndef STEPCOACH_TEST_SUPPORT_H
#define STEPCOACH_TEST_SUPPORT_H

#include <deque>
#include <map>
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include "common/clock.h"
#include "oracle/oracle.h"
#include "planner/planner.h"
#include "environmental_perception/environmental_perception.h"
#include "feedback/change_observer.h"
#include "feedback/goal_evaluator.h"
#include "input/input_event_source.h"
#include "orchestrator/presentation.h"

namespace stepcoach {
namespace testing {

// Replies with queued responses in order, then fails with TRANSPORT
class ScriptedOracle : public IOracle {
public:
    void reply(const std::string& text) {
        m_responses.push_back(Result<std::string, OracleError>::success(text));
    }

    void fail(OracleError::Code code, const std::string& message) {
        m_responses.push_back(Result<std::string, OracleError>::failure(OracleError(code, message)));
    }

    Result<std::string, OracleError> ask(const OracleRequest& request) override {
        m_requests.push_back(request);
        if (m_responses.empty()) {
            return Result<std::string, OracleError>::failure(
                OracleError(OracleError::Code::TRANSPORT, "no scripted response"));
        }
        auto response = m_responses.front();
        m_responses.pop_front();
        return response;
    }

    const std::vector<OracleRequest>& requests() const { return m_requests; }
    size_t callCount() const { return m_requests.size(); }

private:
    std::deque<Result<std::string, OracleError>> m_responses;
    std::vector<OracleRequest> m_requests;
};

inline Snapshot makeSnapshot(const std::string& screenState,
                             PageStatus status = PageStatus::NORMAL,
                             const std::vector<std::string>& elements = {}) {
    Snapshot snapshot;
    snapshot.image.data = {0x89, 'P', 'N', 'G'};
    snapshot.state.appName = "Desktop";
    snapshot.state.screenState = screenState;
    snapshot.state.pageStatus = status;
    snapshot.state.availableElements = elements;
    return snapshot;
}

// Returns queued snapshots; repeats a neutral one when the queue runs dry
class ScriptedPerception : public IPerception {
public:
    void push(const Snapshot& snapshot) {
        m_snapshots.push_back(Result<Snapshot, OracleError>::success(snapshot));
    }

    void pushFailure(const std::string& message) {
        m_snapshots.push_back(Result<Snapshot, OracleError>::failure(
            OracleError(OracleError::Code::TRANSPORT, message)));
    }

    Result<Snapshot, OracleError> capture() override {
        ++m_captures;
        if (m_snapshots.empty()) {
            return Result<Snapshot, OracleError>::success(
                makeSnapshot("screen " + std::to_string(m_captures)));
        }
        auto next = m_snapshots.front();
        m_snapshots.pop_front();
        return next;
    }

    int captures() const { return m_captures; }

private:
    std::deque<Result<Snapshot, OracleError>> m_snapshots;
    int m_captures = 0;
};

// Plans handed out in order; an exhausted queue yields an empty plan
class ScriptedPlanner : public IPlanner {
public:
    void pushPlan(const Plan& plan) { m_plans.push_back(plan); }

    Plan createPlan(const Intent& intent, const ScreenState&, const std::string& knowledge) override {
        ++m_createCalls;
        m_lastKnowledge = knowledge;
        return next(intent);
    }

    Plan replan(const ReplanRequest& request, const ScreenState&) override {
        m_replanRequests.push_back(request);
        return next(request.intent);
    }

    int createCalls() const { return m_createCalls; }
    const std::vector<ReplanRequest>& replanRequests() const { return m_replanRequests; }
    const std::string& lastKnowledge() const { return m_lastKnowledge; }

private:
    std::deque<Plan> m_plans;
    std::vector<ReplanRequest> m_replanRequests;
    std::string m_lastKnowledge;
    int m_createCalls = 0;

    Plan next(const Intent& intent) {
        if (m_plans.empty()) {
            Plan empty;
            empty.intent = intent;
            return empty;
        }
        Plan plan = m_plans.front();
        m_plans.pop_front();
        return plan;
    }
};

// Queued judgments; defaults are CHANGED, NONE and a successful step
class ScriptedChangeObserver : public IChangeObserver {
public:
    std::deque<ChangeClassification> classifications;
    std::deque<UnchangedCause> causes;
    std::deque<bool> verdicts;

    int classifyCalls = 0;
    int causeCalls = 0;
    int verifyCalls = 0;

    ChangeJudgment classify(const Snapshot&, const Snapshot&) override {
        ++classifyCalls;
        ChangeClassification next = ChangeClassification::CHANGED;
        if (!classifications.empty()) {
            next = classifications.front();
            classifications.pop_front();
        }
        return ChangeJudgment{next, "scripted " + changeClassificationToString(next)};
    }

    CauseJudgment unchangedCause(const Step&, const Snapshot&, const Snapshot&) override {
        ++causeCalls;
        CauseJudgment judgment;
        if (!causes.empty()) {
            judgment.cause = causes.front();
            causes.pop_front();
        }
        judgment.justification = "scripted " + unchangedCauseToString(judgment.cause);
        return judgment;
    }

    StepVerdict verifyStep(const Step&, const Snapshot&, const Snapshot&) override {
        ++verifyCalls;
        StepVerdict verdict;
        verdict.success = true;
        if (!verdicts.empty()) {
            verdict.success = verdicts.front();
            verdicts.pop_front();
        }
        verdict.reason = verdict.success ? "" : "expected result not visible";
        verdict.changes = verdict.success ? "scripted change" : "";
        return verdict;
    }
};

class ScriptedGoalEvaluator : public IGoalEvaluator {
public:
    std::deque<bool> answers;
    int calls = 0;

    GoalVerdict evaluate(const Intent&, const Snapshot&) override {
        ++calls;
        GoalVerdict verdict;
        if (!answers.empty()) {
            verdict.achieved = answers.front();
            answers.pop_front();
        }
        verdict.reason = verdict.achieved ? "goal visible" : "goal not visible";
        return verdict;
    }
};

/**
 * Scripted completion signals. A TIMEOUT advances the manual clock by the
 * requested timeout. Hooks keyed by wait index (0-based) run before that wait
 * returns, standing in for another thread.
 */
class ScriptedInputSource : public IInputEventSource {
public:
    explicit ScriptedInputSource(std::shared_ptr<ManualClock> clock) : m_clock(std::move(clock)) {}

    std::deque<WaitResult> script;
    std::map<int, std::function<void()>> hooks;

    std::vector<int> begunSteps;
    std::vector<std::chrono::milliseconds> timeouts;
    int waits = 0;

    void beginStep(const Step& step) override { begunSteps.push_back(step.number); }

    WaitResult waitForSignal(std::chrono::milliseconds timeout) override {
        int index = waits++;
        timeouts.push_back(timeout);
        auto hook = hooks.find(index);
        if (hook != hooks.end()) {
            hook->second();
        }
        if (m_interrupted) {
            return WaitResult::INTERRUPTED;
        }
        WaitResult next = WaitResult::SIGNAL;
        if (!script.empty()) {
            next = script.front();
            script.pop_front();
        }
        if (next == WaitResult::TIMEOUT) {
            m_clock->advance(timeout);
        }
        return next;
    }

    void interrupt() override { m_interrupted = true; }
    void resetInterrupt() override { m_interrupted = false; }

private:
    std::shared_ptr<ManualClock> m_clock;
    bool m_interrupted = false;
};

// Records callbacks as "status:...", "start:N", "complete:N:ok|fail", "help:...", "run:ok|fail"
class RecordingPresenter {
public:
    std::vector<std::string> events;

    PresentationCallbacks callbacks() {
        PresentationCallbacks callbacks;
        callbacks.onStatus = [this](const std::string& text) { events.push_back("status:" + text); };
        callbacks.onStepStart = [this](const Step& step) {
            events.push_back("start:" + std::to_string(step.number));
        };
        callbacks.onStepComplete = [this](const Step& step, bool success) {
            events.push_back("complete:" + std::to_string(step.number) + (success ? ":ok" : ":fail"));
        };
        callbacks.onNeedHelp = [this](const std::string& question) { events.push_back("help:" + question); };
        callbacks.onRunComplete = [this](bool success) { events.push_back(success ? "run:ok" : "run:fail"); };
        return callbacks;
    }

    int count(const std::string& prefix) const {
        int n = 0;
        for (const auto& event : events) {
            if (event.compare(0, prefix.size(), prefix) == 0) ++n;
        }
        return n;
    }

    bool contains(const std::string& event) const {
        for (const auto& e : events) {
            if (e == event) return true;
        }
        return false;
    }
};

inline Plan makePlan(const std::string& goal, const std::vector<Skill>& skills) {
    Plan plan;
    plan.intent = Intent(goal);
    int number = 1;
    for (const auto& skill : skills) {
        plan.steps.emplace_back(number, skill, skill.describe());
        plan.steps.back().expectedResult = "step " + std::to_string(number) + " visible";
        ++number;
    }
    return plan;
}

} // namespace testing
} // namespace stepcoach

#endif // STEPCOACH_TEST_SUPPORT_H
