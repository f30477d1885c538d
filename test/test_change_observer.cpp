#include <iostream>
#include <cassert>
#include <memory>
#include "feedback/change_observer.h"
#include "feedback/goal_evaluator.h"
#include "environmental_perception/environmental_perception.h"
#include "common/structured_logger.h"
#include "test_support.h"

using namespace stepcoach;
using namespace stepcoach::testing;

namespace {

class FixedSnapshotSource : public ISnapshotSource {
public:
    bool failNext = false;

    Result<Screenshot, OracleError> grab() override {
        if (failNext) {
            failNext = false;
            return Result<Screenshot, OracleError>::failure(
                OracleError(OracleError::Code::TRANSPORT, "display unavailable"));
        }
        Screenshot screenshot;
        screenshot.data = {1, 2, 3};
        return Result<Screenshot, OracleError>::success(screenshot);
    }
};

Step clickStep(const std::string& target) {
    Step step(1, Skill::click(TargetDescriptor(target)), "Click \"" + target + "\"");
    step.expectedResult = "The " + target + " dialog opens";
    return step;
}

} // anonymous namespace

void testClassifyLoadingAndError() {
    std::cout << "[TEST] Loading and error screens are recognised\n";

    ScreenState before = makeSnapshot("Inbox").state;

    ScreenState loading = makeSnapshot("Inbox", PageStatus::LOADING).state;
    assert(ChangeObserver::classifyStates(before, loading).classification == ChangeClassification::LOADING);

    ScreenState spinner = makeSnapshot("Inbox").state;
    spinner.description = "A Loading spinner is shown";
    assert(ChangeObserver::classifyStates(before, spinner).classification == ChangeClassification::LOADING);

    ScreenState chinese = makeSnapshot("正在加载页面").state;
    assert(ChangeObserver::classifyStates(before, chinese).classification == ChangeClassification::LOADING);

    ScreenState failed = makeSnapshot("Inbox", PageStatus::ERROR).state;
    failed.description = "Connection lost";
    ChangeJudgment error = ChangeObserver::classifyStates(before, failed);
    assert(error.classification == ChangeClassification::ERROR);
    assert(error.justification.find("Connection lost") != std::string::npos);

    ScreenState keyword = makeSnapshot("Send Failed").state;
    assert(ChangeObserver::classifyStates(before, keyword).classification == ChangeClassification::ERROR);

    std::cout << "[OK] Loading and error test passed\n\n";
}

void testClassifyUnchangedAndChanged() {
    std::cout << "[TEST] Identical states are unchanged, anything else changed\n";

    ScreenState before = makeSnapshot("Inbox", PageStatus::NORMAL, {"Compose", "Search"}).state;
    ScreenState reordered = makeSnapshot("Inbox", PageStatus::NORMAL, {"Search", "Compose"}).state;
    reordered.description = "A different wording of the same screen";
    assert(ChangeObserver::classifyStates(before, reordered).classification == ChangeClassification::UNCHANGED);

    ScreenState newScreen = makeSnapshot("Compose window", PageStatus::NORMAL, {"Send"}).state;
    ChangeJudgment changed = ChangeObserver::classifyStates(before, newScreen);
    assert(changed.classification == ChangeClassification::CHANGED);
    assert(changed.justification.find("Compose window") != std::string::npos);

    ScreenState extraElement = makeSnapshot("Inbox", PageStatus::NORMAL, {"Compose", "Search", "Draft"}).state;
    assert(ChangeObserver::classifyStates(before, extraElement).classification == ChangeClassification::CHANGED);

    auto oracle = std::make_shared<ScriptedOracle>();
    ChangeObserver observer(oracle);
    observer.classify(makeSnapshot("Inbox"), makeSnapshot("Inbox"));
    assert(oracle->callCount() == 0);

    std::cout << "[OK] Unchanged and changed test passed\n\n";
}

void testUnchangedCauseParsing() {
    std::cout << "[TEST] Unchanged cause answers are parsed\n";

    auto oracle = std::make_shared<ScriptedOracle>();
    oracle->reply("{\"change_type\": \"dynamic_effect\", \"description\": \"clock ticked\"}");
    oracle->reply("```json\n{\"change_type\": \"USER_ACTION\"}\n```");
    oracle->reply("{\"change_type\": \"none\", \"description\": \"nothing moved\"}");
    oracle->reply("I am not sure");
    oracle->fail(OracleError::Code::HTTP_STATUS, "500");

    ChangeObserver observer(oracle);
    Step step = clickStep("Settings");
    Snapshot before = makeSnapshot("Desktop");
    Snapshot after = makeSnapshot("Desktop");

    CauseJudgment dynamic = observer.unchangedCause(step, before, after);
    assert(dynamic.cause == UnchangedCause::DYNAMIC_EFFECT);
    assert(dynamic.justification == "clock ticked");

    assert(observer.unchangedCause(step, before, after).cause == UnchangedCause::USER_ACTION);
    assert(observer.unchangedCause(step, before, after).cause == UnchangedCause::NONE);

    CauseJudgment unparsed = observer.unchangedCause(step, before, after);
    assert(unparsed.cause == UnchangedCause::NONE);
    assert(!unparsed.oracleFailed);

    CauseJudgment failed = observer.unchangedCause(step, before, after);
    assert(failed.cause == UnchangedCause::NONE);
    assert(failed.oracleFailed);

    const OracleRequest& request = oracle->requests()[0];
    assert(request.purpose == "unchanged_cause");
    assert(request.images.size() == 2);
    assert(request.prompt.find("Click \"Settings\"") != std::string::npos);

    std::cout << "[OK] Unchanged cause test passed\n\n";
}

void testVerifyStepNeedsBothFlags() {
    std::cout << "[TEST] Step verification needs success and a matching result\n";

    auto oracle = std::make_shared<ScriptedOracle>();
    oracle->reply("{\"success\": true, \"matches_expected\": true, \"changes\": \"dialog opened\"}");
    oracle->reply("{\"success\": true, \"matches_expected\": false, \"reason\": \"wrong dialog\"}");
    oracle->fail(OracleError::Code::TRANSPORT, "offline");

    ChangeObserver observer(oracle);
    Step step = clickStep("Settings");
    Snapshot before = makeSnapshot("Desktop");
    Snapshot after = makeSnapshot("Settings");

    StepVerdict ok = observer.verifyStep(step, before, after);
    assert(ok.success);
    assert(ok.changes == "dialog opened");

    StepVerdict mismatch = observer.verifyStep(step, before, after);
    assert(!mismatch.success);
    assert(mismatch.reason == "wrong dialog");

    StepVerdict offline = observer.verifyStep(step, before, after);
    assert(!offline.success);
    assert(offline.oracleFailed);

    assert(oracle->requests()[0].prompt.find("The Settings dialog opens") != std::string::npos);

    std::cout << "[OK] Step verification test passed\n\n";
}

void testGoalEvaluator() {
    std::cout << "[TEST] Goal evaluator reads goal_achieved\n";

    auto oracle = std::make_shared<ScriptedOracle>();
    oracle->reply("{\"goal_achieved\": true, \"reason\": \"Wi-Fi is on\"}");
    oracle->reply("{\"goal_achieved\": false}");
    oracle->reply("yes, probably");
    oracle->fail(OracleError::Code::RATE_LIMITED, "busy");

    GoalEvaluator evaluator(oracle);
    Intent intent("Turn on Wi-Fi");
    intent.targetState = "Wi-Fi toggle shows On";
    Snapshot snapshot = makeSnapshot("Network settings");

    GoalVerdict achieved = evaluator.evaluate(intent, snapshot);
    assert(achieved.achieved);
    assert(achieved.reason == "Wi-Fi is on");

    assert(!evaluator.evaluate(intent, snapshot).achieved);
    assert(!evaluator.evaluate(intent, snapshot).achieved);

    GoalVerdict failed = evaluator.evaluate(intent, snapshot);
    assert(!failed.achieved);
    assert(failed.oracleFailed);

    const OracleRequest& request = oracle->requests()[0];
    assert(request.purpose == "goal_check");
    assert(request.images.size() == 1);
    assert(request.prompt.find("Turn on Wi-Fi") != std::string::npos);
    assert(request.prompt.find("Target state: Wi-Fi toggle shows On") != std::string::npos);

    std::cout << "[OK] Goal evaluator test passed\n\n";
}

void testOraclePerception() {
    std::cout << "[TEST] Perception grabs the screen and analyses it\n";

    auto source = std::make_shared<FixedSnapshotSource>();
    auto oracle = std::make_shared<ScriptedOracle>();
    auto clock = std::make_shared<ManualClock>();
    oracle->reply("{\"app_name\": \"Mail\", \"screen_state\": \"Inbox\", \"page_status\": \"loading\","
                  " \"available_elements\": [\"Compose\"]}");
    oracle->reply("no json here");

    OraclePerception perception(source, oracle, clock);

    auto first = perception.capture();
    assert(first.ok());
    assert(first.value().state.appName == "Mail");
    assert(first.value().state.pageStatus == PageStatus::LOADING);
    assert(first.value().state.availableElements.size() == 1);
    assert(first.value().image.isValid());
    assert(first.value().capturedAt == clock->now());

    auto second = perception.capture();
    assert(second.ok());
    assert(second.value().state.pageStatus == PageStatus::UNKNOWN);

    source->failNext = true;
    auto third = perception.capture();
    assert(!third.ok());
    assert(third.error().message == "display unavailable");
    assert(oracle->callCount() == 2);

    FileSnapshotSource missing("/nonexistent/stepcoach/screen.png");
    assert(!missing.grab().ok());

    CommandSnapshotSource unconfigured("", "/tmp/stepcoach_screen.png");
    auto grabbed = unconfigured.grab();
    assert(!grabbed.ok());
    assert(grabbed.error().code == OracleError::Code::NOT_CONFIGURED);

    std::cout << "[OK] Perception test passed\n\n";
}

int main() {
    std::cout << "=== StepCoach Change Observer Test Suite ===\n\n";
    StructuredLogger::getInstance().setLogLevel(LogLevel::CRITICAL);

    try {
        testClassifyLoadingAndError();
        testClassifyUnchangedAndChanged();
        testUnchangedCauseParsing();
        testVerifyStepNeedsBothFlags();
        testGoalEvaluator();
        testOraclePerception();

        StructuredLogger::getInstance().shutdown();
        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
