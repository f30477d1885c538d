#include "execution_engine.h"
#include "../common/structured_logger.h"
#include "../common/error_handler.h"
#include "../common/string_utils.h"
#include <algorithm>

namespace stepcoach {

namespace {

std::string nextRunId() {
    static std::atomic<unsigned long> counter{0};
    return "run-" + std::to_string(++counter);
}

const char* const kAskForHelp = " Please ask someone you trust to help you with this.";

} // anonymous namespace

void EngineDependencies::validate() const {
    const char* missing = nullptr;
    if (!planner) missing = "planner";
    else if (!perception) missing = "perception";
    else if (!changeObserver) missing = "change observer";
    else if (!goalEvaluator) missing = "goal evaluator";
    else if (!inputSource) missing = "input event source";
    else if (!clock) missing = "clock";

    if (missing) {
        STEPCOACH_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::CRITICAL,
                        "Execution engine dependency missing", missing,
                        "EngineDependencies::validate");
    }
}

ExecutionEngine::ExecutionEngine(const EngineDependencies& dependencies, const EngineConfig& config)
    : m_dependencies(dependencies)
    , m_config(config)
    , m_presenter(dependencies.callbacks)
    , m_safety(config.sensitiveOperations, config.warnOnSensitiveSteps)
    , m_running(false)
    , m_cancelRequested(false) {

    m_dependencies.validate();

    if (m_config.maxStepRetries < 0 || m_config.maxReplans < 0 ||
        m_config.idleTimeoutMs <= 0 || m_config.loadingPollInitialMs <= 0 ||
        m_config.loadingPollCapMs < 0 || m_config.settleDelayMs < 0) {
        STEPCOACH_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::CRITICAL,
                        "Invalid engine budgets",
                        "retries, replans and delays must be non-negative; idle timeout and poll interval positive",
                        "ExecutionEngine::ExecutionEngine");
    }

    SLOG_DEBUG().message("Execution engine created")
        .context("max_step_retries", m_config.maxStepRetries)
        .context("max_replans", m_config.maxReplans)
        .context("idle_timeout_ms", m_config.idleTimeoutMs)
        .context("loading_poll_cap_ms", m_config.loadingPollCapMs);
}

ExecutionEngine::~ExecutionEngine() {
    cancel();
}

RunResult ExecutionEngine::run(const Intent& intent, const std::string& knowledgeContext) {
    ExecutionContext context;
    context.intent = intent;

    return guardedRun(context, [&]() {
        SLOG_INFO().message("Run started")
            .context("intent", intent.toJson());

        setStatus(context, ExecutionStatus::PLANNING);
        m_presenter.status("Looking at your screen to work out the steps...");

        auto initial = captureSnapshot(context, "initial");
        ScreenState screen = initial ? initial->state : ScreenState::unknown("screen capture failed");
        context.before = initial;

        if (cancelRequested()) {
            return finish(context, RunOutcome::CANCELLED, "The task was cancelled.");
        }

        Plan plan = m_dependencies.planner->createPlan(intent, screen, knowledgeContext);
        plan.intent = intent;
        context.plan = plan;
        publishStep(context);

        if (plan.isEmpty()) {
            return finish(context, RunOutcome::PLAN_EMPTY,
                          "I could not find a way to \"" + intent.goal + "\" from the current screen.");
        }

        m_presenter.status("I have a plan with " + std::to_string(plan.size()) + " steps.");
        return executeLoop(context);
    });
}

RunResult ExecutionEngine::execute(const Plan& plan) {
    ExecutionContext context;
    context.intent = plan.intent;
    context.plan = plan;

    return guardedRun(context, [&]() {
        SLOG_INFO().message("Executing supplied plan")
            .context("steps", plan.size());

        publishStep(context);
        if (plan.isEmpty()) {
            return finish(context, RunOutcome::PLAN_EMPTY, "There are no steps to follow.");
        }
        return executeLoop(context);
    });
}

RunResult ExecutionEngine::guardedRun(ExecutionContext& context, const std::function<RunResult()>& body) {
    bool expected = false;
    if (!m_running.compare_exchange_strong(expected, true)) {
        SLOG_ERROR().message("Run rejected, another run is active");
        RunResult rejected;
        rejected.outcome = RunOutcome::INTERNAL_ERROR;
        rejected.message = "Another task is already running.";
        return rejected;
    }

    {
        std::lock_guard<std::mutex> lock(m_feedbackMutex);
        m_pendingFeedback.reset();
    }
    // A cancel issued before the run started still applies to it
    if (!cancelRequested()) {
        m_dependencies.inputSource->resetInterrupt();
    }

    context.runId = nextRunId();
    context.startedAt = m_dependencies.clock->now();
    context.idleSince = context.startedAt;

    ScopedLogContext runScope("run_id", context.runId);
    RunResult result;
    try {
        if (cancelRequested()) {
            SLOG_INFO().message("Run cancelled before it started");
            result = finish(context, RunOutcome::CANCELLED, "The task was cancelled.");
        } else {
            result = body();
        }
    } catch (const std::exception& e) {
        ErrorHandler::getInstance().handleException(e, "ExecutionEngine::run");
        result = finish(context, RunOutcome::INTERNAL_ERROR,
                        std::string("Something went wrong inside the assistant: ") + e.what() + ".");
    }

    {
        std::lock_guard<std::mutex> lock(m_progressMutex);
        m_currentStep.reset();
    }
    m_cancelRequested = false;
    m_dependencies.inputSource->resetInterrupt();
    m_running = false;
    return result;
}

RunResult ExecutionEngine::executeLoop(ExecutionContext& context) {
    while (true) {
        if (cancelRequested()) {
            return finish(context, RunOutcome::CANCELLED, "The task was cancelled.");
        }

        if (!context.hasCurrentStep()) {
            return finish(context, RunOutcome::COMPLETED, "All steps are done.");
        }

        const Step step = context.currentStep();
        publishStep(context);

        if (step.skill.isDone()) {
            return finish(context, RunOutcome::COMPLETED, "Task complete: " + context.intent.goal + ".");
        }

        if (!context.before) {
            auto baseline = captureSnapshot(context, "baseline");
            if (baseline) {
                context.before = *baseline;
            } else {
                Snapshot unknown;
                unknown.capturedAt = m_dependencies.clock->now();
                unknown.state = ScreenState::unknown("screen capture failed");
                context.before = unknown;
            }
        }

        announceStep(context, step);
        StepOutcome outcome = awaitAndVerify(context, step);

        switch (outcome.decision) {
            case StepDecision::ADVANCE:
                m_presenter.stepComplete(step, true);
                context.completedSteps.push_back(step.describe());
                ++context.cursor;
                context.stepRetries = 0;
                ++context.statistics.advances;
                SLOG_INFO().message("Step succeeded")
                    .context("step_number", step.number)
                    .context("changes", outcome.reason);
                break;

            case StepDecision::RETRY:
                m_presenter.stepComplete(step, false);
                ++context.statistics.retries;
                SLOG_INFO().message("Retrying step")
                    .context("step_number", step.number)
                    .context("attempt", context.stepRetries + 1)
                    .context("reason", outcome.reason);
                m_presenter.status("That did not seem to work (" + outcome.reason + "). Let's try this step again.");
                if (!step.errorRecoveryHint.empty()) {
                    m_presenter.status("Tip: " + step.errorRecoveryHint);
                }
                break;

            case StepDecision::REPLAN: {
                m_presenter.stepComplete(step, false);
                auto terminal = replan(context, outcome.reason);
                if (terminal) {
                    return *terminal;
                }
                break;
            }

            case StepDecision::GOAL_REACHED:
                m_presenter.stepComplete(step, true);
                context.completedSteps.push_back(step.describe());
                SLOG_INFO().message("Goal reached early")
                    .context("step_number", step.number)
                    .context("remaining_steps", context.plan.size() - context.cursor - 1);
                return finish(context, RunOutcome::COMPLETED,
                              "Task complete: " + context.intent.goal + ". " + outcome.reason);

            case StepDecision::CANCELLED:
                return finish(context, RunOutcome::CANCELLED, "The task was cancelled.");
        }
    }
}

void ExecutionEngine::announceStep(ExecutionContext& context, const Step& step) {
    setStatus(context, ExecutionStatus::PENDING);

    auto caution = m_safety.review(step);
    if (caution) {
        m_presenter.status(*caution);
    }

    m_presenter.stepStart(step);
    m_dependencies.inputSource->beginStep(step);
    context.idleSince = m_dependencies.clock->now();
    ++context.statistics.announcements;

    SLOG_INFO().message("Step announced")
        .context("step_number", step.number)
        .context("action", step.skill.describe())
        .context("attempt", context.stepRetries + 1)
        .context("replans", context.replanCount);
}

ExecutionEngine::StepOutcome ExecutionEngine::awaitAndVerify(ExecutionContext& context, const Step& step) {
    // Set after a page-effect verdict: the next idle timeout re-checks the screen
    bool recheckOnTimeout = false;
    int unsignalledRechecks = 0;

    while (true) {
        setStatus(context, ExecutionStatus::WAITING_FOR_COMPLETION);

        WaitResult waitResult = m_dependencies.inputSource->waitForSignal(remainingIdle(context));
        ++context.statistics.waits;

        switch (waitResult) {
            case WaitResult::INTERRUPTED: {
                if (cancelRequested()) {
                    return {StepDecision::CANCELLED, "cancelled"};
                }
                m_dependencies.inputSource->resetInterrupt();
                auto feedback = takeFeedback();
                if (feedback) {
                    SLOG_INFO().message("User feedback received")
                        .context("step_number", step.number)
                        .context("feedback", *feedback);
                    return {StepDecision::REPLAN, "user feedback: " + *feedback};
                }
                continue;
            }

            case WaitResult::TIMEOUT:
                ++context.statistics.idleTimeouts;
                context.idleSince = m_dependencies.clock->now();
                if (recheckOnTimeout) {
                    recheckOnTimeout = false;
                    ++context.statistics.rechecks;
                    SLOG_DEBUG().message("Idle timeout after a page effect, checking the screen again")
                        .context("step_number", step.number);
                    break;
                }
                SLOG_DEBUG().message("Idle timeout, offering help")
                    .context("step_number", step.number);
                m_presenter.needHelp(renderHelpPrompt(step));
                continue;

            case WaitResult::SIGNAL:
                ++context.statistics.signalsReceived;
                recheckOnTimeout = false;
                unsignalledRechecks = 0;
                break;
        }

        context.idleSince = m_dependencies.clock->now();
        if (cancelRequested()) {
            return {StepDecision::CANCELLED, "cancelled"};
        }

        setStatus(context, ExecutionStatus::VERIFYING);
        if (m_config.settleDelayMs > 0) {
            m_dependencies.clock->sleepFor(std::chrono::milliseconds(m_config.settleDelayMs));
        }

        auto after = captureSnapshot(context, "after_step");
        if (!after) {
            return stepFailed(context, "the screen could not be captured");
        }
        if (cancelRequested()) {
            return {StepDecision::CANCELLED, "cancelled"};
        }

        ChangeJudgment judgment = m_dependencies.changeObserver->classify(*context.before, *after);
        if (judgment.classification == ChangeClassification::LOADING) {
            judgment = waitWhileLoading(context, *after);
            if (cancelRequested()) {
                return {StepDecision::CANCELLED, "cancelled"};
            }
        }

        SLOG_DEBUG().message("Screen change classified")
            .context("step_number", step.number)
            .context("classification", changeClassificationToString(judgment.classification))
            .context("justification", judgment.justification);

        switch (judgment.classification) {
            case ChangeClassification::LOADING:
            case ChangeClassification::ERROR:
                STEPCOACH_HANDLE_ERROR(ErrorType::ENVIRONMENT_ERROR, ErrorSeverity::MEDIUM,
                                       "Error state on screen after step", judgment.justification,
                                       "ExecutionEngine::awaitAndVerify");
                context.before = *after;
                return {StepDecision::REPLAN, "the screen shows an error: " + judgment.justification};

            case ChangeClassification::UNCHANGED: {
                CauseJudgment cause = m_dependencies.changeObserver->unchangedCause(step, *context.before, *after);
                if (cause.oracleFailed) {
                    ++context.statistics.oracleFailures;
                }
                switch (cause.cause) {
                    case UnchangedCause::DYNAMIC_EFFECT:
                        ++context.statistics.dynamicEffects;
                        if (++unsignalledRechecks > m_config.maxStepRetries) {
                            return stepFailed(context, "the screen kept changing by itself");
                        }
                        SLOG_INFO().message("Change attributed to the page itself, still waiting")
                            .context("step_number", step.number)
                            .context("justification", cause.justification);
                        recheckOnTimeout = true;
                        continue;

                    case UnchangedCause::NONE:
                        STEPCOACH_HANDLE_ERROR(ErrorType::NO_OP_STEP, ErrorSeverity::LOW,
                                               "Step had no visible effect", step.describe(),
                                               "ExecutionEngine::awaitAndVerify");
                        return stepFailed(context, "nothing changed on the screen");

                    case UnchangedCause::USER_ACTION:
                        return judgeChanged(context, step, *after);
                }
                break;
            }

            case ChangeClassification::CHANGED:
                return judgeChanged(context, step, *after);
        }

        return stepFailed(context, "the screen change could not be judged");
    }
}

ExecutionEngine::StepOutcome ExecutionEngine::judgeChanged(ExecutionContext& context, const Step& step,
                                                          const Snapshot& after) {
    if (cancelRequested()) {
        return {StepDecision::CANCELLED, "cancelled"};
    }

    GoalVerdict goal = m_dependencies.goalEvaluator->evaluate(context.intent, after);
    ++context.statistics.goalChecks;
    if (goal.oracleFailed) {
        ++context.statistics.oracleFailures;
    }
    if (goal.achieved) {
        context.before = after;
        return {StepDecision::GOAL_REACHED, goal.reason};
    }

    if (cancelRequested()) {
        return {StepDecision::CANCELLED, "cancelled"};
    }

    StepVerdict verdict = m_dependencies.changeObserver->verifyStep(step, *context.before, after);
    if (verdict.oracleFailed) {
        ++context.statistics.oracleFailures;
    }
    context.before = after;

    if (verdict.success) {
        return {StepDecision::ADVANCE, verdict.changes};
    }
    return stepFailed(context, verdict.reason.empty() ? "the expected result did not appear" : verdict.reason);
}

ExecutionEngine::StepOutcome ExecutionEngine::stepFailed(ExecutionContext& context, const std::string& reason) {
    if (++context.stepRetries > m_config.maxStepRetries) {
        SLOG_WARNING().message("Step retry budget exhausted")
            .context("step_retries", context.stepRetries)
            .context("reason", reason);
        return {StepDecision::REPLAN, reason};
    }
    return {StepDecision::RETRY, reason};
}

ChangeJudgment ExecutionEngine::waitWhileLoading(ExecutionContext& context, Snapshot& after) {
    const std::chrono::milliseconds cap(m_config.loadingPollCapMs);
    std::chrono::milliseconds delay(m_config.loadingPollInitialMs);
    std::chrono::milliseconds waited(0);
    ChangeJudgment judgment{ChangeClassification::LOADING, "page is loading"};

    while (waited < cap) {
        if (cancelRequested()) {
            return judgment;
        }

        auto pause = std::min(delay, cap - waited);
        m_dependencies.clock->sleepFor(pause);
        waited += pause;
        delay *= 2;
        ++context.statistics.loadingPolls;

        auto polled = captureSnapshot(context, "loading_poll");
        if (!polled) {
            continue;
        }
        after = *polled;
        judgment = m_dependencies.changeObserver->classify(*context.before, after);
        if (judgment.classification != ChangeClassification::LOADING) {
            SLOG_DEBUG().message("Loading settled")
                .context("waited_ms", waited.count());
            return judgment;
        }
    }

    STEPCOACH_HANDLE_ERROR(ErrorType::TIMEOUT_ERROR, ErrorSeverity::MEDIUM,
                           "Page still loading at polling cap",
                           std::to_string(cap.count()) + " ms",
                           "ExecutionEngine::waitWhileLoading");
    return {ChangeClassification::ERROR,
            "still loading after " + std::to_string(cap.count()) + " ms"};
}

std::optional<RunResult> ExecutionEngine::replan(ExecutionContext& context, const std::string& reason) {
    setStatus(context, ExecutionStatus::REPLANNING);

    if (context.replanCount >= m_config.maxReplans) {
        return finish(context, RunOutcome::GOAL_UNREACHABLE,
                      "I could not find a way to finish \"" + context.intent.goal + "\" (" + reason + ").");
    }
    if (cancelRequested()) {
        return finish(context, RunOutcome::CANCELLED, "The task was cancelled.");
    }

    ++context.replanCount;
    ++context.statistics.replans;
    SLOG_INFO().message("Replanning")
        .context("replan", context.replanCount)
        .context("completed_steps", context.completedSteps.size())
        .context("reason", reason);
    m_presenter.status("Let me work out a new plan from here...");

    ReplanRequest request;
    request.intent = context.intent;
    request.completedSteps = context.completedSteps;
    request.failureReason = reason;

    ScreenState screen = context.before ? context.before->state
                                        : ScreenState::unknown("no screen capture available");
    Plan plan = m_dependencies.planner->replan(request, screen);

    if (cancelRequested()) {
        return finish(context, RunOutcome::CANCELLED, "The task was cancelled.");
    }
    if (plan.isEmpty()) {
        return finish(context, RunOutcome::PLAN_EMPTY,
                      "I could not find another way to \"" + context.intent.goal + "\".");
    }

    plan.intent = context.intent;
    context.plan = plan;
    context.cursor = 0;
    context.stepRetries = 0;
    publishStep(context);
    return std::nullopt;
}

std::optional<Snapshot> ExecutionEngine::captureSnapshot(ExecutionContext& context, const std::string& purpose) {
    auto captured = m_dependencies.perception->capture();
    if (!captured) {
        ++context.statistics.oracleFailures;
        STEPCOACH_HANDLE_ERROR(ErrorType::PERCEPTION_ERROR, ErrorSeverity::MEDIUM,
                               "Screen capture failed", captured.error().message,
                               "ExecutionEngine::" + purpose);
        return std::nullopt;
    }
    return captured.value();
}

void ExecutionEngine::cancel() {
    if (m_cancelRequested.exchange(true)) {
        return;
    }
    if (m_running.load()) {
        SLOG_INFO().message("Cancellation requested");
    }
    m_dependencies.inputSource->interrupt();
}

void ExecutionEngine::submitUserFeedback(const std::string& feedback) {
    std::string text = utils::StringUtils::trim(feedback);
    if (text.empty()) {
        return;
    }
    if (!m_running.load()) {
        SLOG_DEBUG().message("Feedback ignored, no active run").context("feedback", text);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_feedbackMutex);
        m_pendingFeedback = text;
    }
    m_dependencies.inputSource->interrupt();
}

std::optional<std::string> ExecutionEngine::takeFeedback() {
    std::lock_guard<std::mutex> lock(m_feedbackMutex);
    std::optional<std::string> feedback;
    feedback.swap(m_pendingFeedback);
    return feedback;
}

bool ExecutionEngine::isRunning() const {
    return m_running.load();
}

EngineProgress ExecutionEngine::getProgress() const {
    std::lock_guard<std::mutex> lock(m_progressMutex);
    return m_progress;
}

std::optional<Step> ExecutionEngine::getCurrentStep() const {
    std::lock_guard<std::mutex> lock(m_progressMutex);
    return m_currentStep;
}

void ExecutionEngine::setStatus(ExecutionContext& context, ExecutionStatus status) {
    context.status = status;
    std::lock_guard<std::mutex> lock(m_progressMutex);
    m_progress.status = status;
}

void ExecutionEngine::publishStep(ExecutionContext& context) {
    std::lock_guard<std::mutex> lock(m_progressMutex);
    m_progress.totalSteps = static_cast<int>(context.plan.size());
    m_progress.replanCount = context.replanCount;
    if (context.hasCurrentStep()) {
        m_progress.currentStep = static_cast<int>(context.cursor) + 1;
        m_currentStep = context.currentStep();
    } else {
        m_progress.currentStep = 0;
        m_currentStep.reset();
    }
}

RunResult ExecutionEngine::finish(ExecutionContext& context, RunOutcome outcome, const std::string& message) {
    RunResult result;
    result.outcome = outcome;
    result.success = outcome == RunOutcome::COMPLETED;
    result.message = message;

    switch (outcome) {
        case RunOutcome::COMPLETED:
            break;
        case RunOutcome::PLAN_EMPTY:
            STEPCOACH_HANDLE_ERROR(ErrorType::PLAN_EMPTY, ErrorSeverity::MEDIUM,
                                   "No feasible plan", context.intent.goal, "ExecutionEngine::finish");
            result.message += kAskForHelp;
            break;
        case RunOutcome::GOAL_UNREACHABLE:
            STEPCOACH_HANDLE_ERROR(ErrorType::GOAL_UNREACHABLE, ErrorSeverity::HIGH,
                                   "Replan budget exhausted", context.intent.goal, "ExecutionEngine::finish");
            result.message += kAskForHelp;
            break;
        case RunOutcome::CANCELLED:
            STEPCOACH_HANDLE_ERROR(ErrorType::CANCELLED, ErrorSeverity::LOW,
                                   "Run cancelled", context.intent.goal, "ExecutionEngine::finish");
            break;
        case RunOutcome::INTERNAL_ERROR:
            result.message += kAskForHelp;
            break;
    }

    setStatus(context, result.success ? ExecutionStatus::COMPLETED : ExecutionStatus::FAILED);
    result.statistics = context.statistics;
    result.completedSteps = context.completedSteps;
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        m_dependencies.clock->now() - context.startedAt);

    SLOG_INFO().message("Run finished")
        .context("outcome", runOutcomeToString(outcome))
        .context("statistics", context.statistics.toJson())
        .context("elapsed_ms", result.elapsed.count());

    m_presenter.status(result.message);
    m_presenter.runComplete(result.success);
    return result;
}

std::string ExecutionEngine::renderHelpPrompt(const Step& step) const {
    return utils::StringUtils::substituteVariables(m_config.helpPrompt, {{"STEP", step.describe()}});
}

std::chrono::milliseconds ExecutionEngine::remainingIdle(const ExecutionContext& context) const {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        m_dependencies.clock->now() - context.idleSince);
    auto remaining = std::chrono::milliseconds(m_config.idleTimeoutMs) - elapsed;
    return std::max(remaining, std::chrono::milliseconds(0));
}

} // namespace stepcoach
