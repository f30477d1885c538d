#include <iostream>
#include <cassert>
#include <sstream>
#include <thread>
#include <chrono>
#include <atomic>
#include <vector>
#include "ui_module/ui_module.h"
#include "orchestrator/safety_advisor.h"
#include "common/shutdown_manager.h"
#include "common/structured_logger.h"
#include "test_support.h"

using namespace stepcoach;
using namespace stepcoach::testing;

void testStepRendering() {
    std::cout << "[TEST] Steps are rendered for the person at the screen\n";

    std::ostringstream out;
    UIModule ui(out);

    Step step(2, Skill::click(TargetDescriptor("Wi-Fi")), "Click the Wi-Fi tile");
    step.visualHint = "top right of the panel";
    step.expectedResult = "The tile turns blue";

    PresentationCallbacks callbacks = ui.callbacks();
    callbacks.onStepStart(step);
    callbacks.onStepComplete(step, true);
    callbacks.onNeedHelp("Need help completing this step: Click the Wi-Fi tile?");
    callbacks.onStatus("I have a plan with 3 steps.");
    callbacks.onRunComplete(true);

    std::string text = out.str();
    assert(text.find("Step 2: Click the Wi-Fi tile") != std::string::npos);
    assert(text.find("Where: top right of the panel") != std::string::npos);
    assert(text.find("You should see: The tile turns blue") != std::string::npos);
    assert(text.find("Step 2 done.") != std::string::npos);
    assert(text.find("Need help completing this step") != std::string::npos);
    assert(text.find("[Coach]: I have a plan with 3 steps.") != std::string::npos);
    assert(text.find("Well done!") != std::string::npos);

    std::cout << "[OK] Step rendering test passed\n\n";
}

void testPlanAndResultRendering() {
    std::cout << "[TEST] Plans and results are summarised\n";

    std::ostringstream out;
    UIModule ui(out);

    ui.displayPlan(makePlan("Open settings", {Skill::click(TargetDescriptor("Start button")), Skill::done()}));
    ui.displayPlan(Plan());

    RunResult result;
    result.outcome = RunOutcome::GOAL_UNREACHABLE;
    result.message = "I could not find a way to finish \"Open settings\".";
    result.completedSteps = {"Click \"Start button\""};
    result.statistics.retries = 4;
    result.statistics.replans = 3;
    ui.displayResult(result);

    ui.displayFeedback("   ");
    ui.displayFeedback(std::string(2500, 'x'));

    std::string text = out.str();
    assert(text.find("Plan for \"Open settings\":") != std::string::npos);
    assert(text.find("1. Click \"Start button\"") != std::string::npos);
    assert(text.find("2. Task complete") != std::string::npos);
    assert(text.find("No plan could be made") != std::string::npos);
    assert(text.find("[Stopped]: I could not find a way") != std::string::npos);
    assert(text.find("1 steps completed, 4 retries, 3 new plans.") != std::string::npos);
    assert(text.find("... [truncated]") != std::string::npos);
    assert(text.find("[Coach]:    \n") == std::string::npos);

    std::cout << "[OK] Plan and result test passed\n\n";
}

void testConsoleInputListener() {
    std::cout << "[TEST] Empty lines signal, other lines are feedback\n";

    std::istringstream in("\n  \nthe window closed\n\nwrong button \n");
    std::atomic<int> signals(0);
    std::vector<std::string> feedback;

    ConsoleInputListener listener(
        in,
        [&signals]() { ++signals; },
        [&feedback](const std::string& text) { feedback.push_back(text); });
    listener.start();
    listener.waitForEnd();

    assert(signals.load() == 3);
    assert(feedback.size() == 2);
    assert(feedback[0] == "the window closed");
    assert(feedback[1] == "wrong button");

    std::istringstream ignored("\n\n");
    int lateSignals = 0;
    ConsoleInputListener stopped(ignored, [&lateSignals]() { ++lateSignals; }, nullptr);
    stopped.stop();
    assert(lateSignals == 0);

    std::cout << "[OK] Console input test passed\n\n";
}

void testSafetyAdvisor() {
    std::cout << "[TEST] Sensitive steps get a caution\n";

    SafetyAdvisor advisor({}, true);

    Step payment(3, Skill::click(TargetDescriptor("Confirm Payment")), "");
    auto caution = advisor.review(payment);
    assert(caution.has_value());
    assert(caution->find("step 3") != std::string::npos);
    assert(caution->find("\"payment\"") != std::string::npos);

    Step chinese(1, Skill::click(TargetDescriptor("删除文件")), "");
    assert(advisor.review(chinese).has_value());

    Step harmless(1, Skill::click(TargetDescriptor("Display settings")), "Open display settings");
    assert(!advisor.review(harmless).has_value());

    SafetyAdvisor disabled({}, false);
    assert(!disabled.review(payment).has_value());

    SafetyAdvisor custom({"Format"}, true);
    Step format(1, Skill::click(TargetDescriptor("Format disk")), "");
    assert(custom.review(format).has_value());
    assert(!custom.review(payment).has_value());

    std::cout << "[OK] Safety advisor test passed\n\n";
}

void testShutdownWatcher() {
    std::cout << "[TEST] Shutdown requests reach the watcher callback once\n";

    auto& shutdown = ShutdownManager::getInstance();
    shutdown.reset();

    std::atomic<int> calls(0);
    {
        ShutdownWatcher watcher([&calls]() { ++calls; }, std::chrono::milliseconds(5));
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        assert(!watcher.fired());

        shutdown.requestShutdown();
        for (int i = 0; i < 200 && !watcher.fired(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        assert(watcher.fired());
    }
    assert(calls.load() == 1);
    assert(shutdown.incrementSignalCount() == 1);

    shutdown.reset();
    assert(!shutdown.isShutdownRequested());
    assert(shutdown.getSignalCount() == 0);

    ShutdownWatcher quiet([&calls]() { ++calls; }, std::chrono::milliseconds(5));
    quiet.stop();
    assert(!quiet.fired());
    assert(calls.load() == 1);

    std::cout << "[OK] Shutdown watcher test passed\n\n";
}

int main() {
    std::cout << "=== StepCoach Console UI Test Suite ===\n\n";
    StructuredLogger::getInstance().setLogLevel(LogLevel::CRITICAL);

    try {
        testStepRendering();
        testPlanAndResultRendering();
        testConsoleInputListener();
        testSafetyAdvisor();
        testShutdownWatcher();

        StructuredLogger::getInstance().shutdown();
        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
