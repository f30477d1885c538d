#ifndef STEPCOACH_UI_MODULE_H
#define STEPCOACH_UI_MODULE_H

#include "../orchestrator/presentation.h"
#include "../common/types.h"
#include "../planner/plan.h"
#include <string>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <functional>

namespace stepcoach {

/**
 * @brief Terminal presentation of a run
 */
class UIModule {
public:
    explicit UIModule(std::ostream& out = std::cout);

    /**
     * @brief Callbacks bound to this module; it must outlive the engine using them
     */
    PresentationCallbacks callbacks();

    void displayFeedback(const std::string& message);
    void displayStep(const Step& step);
    void displayStepResult(const Step& step, bool success);
    void displayHelpPrompt(const std::string& question);
    void displayPlan(const Plan& plan);
    void displayResult(const RunResult& result);

private:
    std::ostream& m_out;
    std::mutex m_mutex;

    void writeLine(const std::string& prefix, const std::string& text);
};

/**
 * @brief Reads lines on a background thread: an empty line means "done with
 * this step", anything else is a correction
 *
 * After stop() returns no callback is running and none will run again.
 */
class ConsoleInputListener {
public:
    ConsoleInputListener(std::istream& in,
                         std::function<void()> onSignal,
                         std::function<void(const std::string&)> onFeedback);
    ~ConsoleInputListener();

    ConsoleInputListener(const ConsoleInputListener&) = delete;
    ConsoleInputListener& operator=(const ConsoleInputListener&) = delete;

    void start();
    void stop();

    /**
     * @brief Block until the stream is exhausted
     */
    void waitForEnd();

private:
    struct State {
        std::mutex mutex;
        bool stopped = false;
        std::function<void()> onSignal;
        std::function<void(const std::string&)> onFeedback;
    };

    std::istream& m_in;
    std::shared_ptr<State> m_state;
    std::thread m_thread;

    static void readLoop(std::istream& in, std::shared_ptr<State> state);
};

} // namespace stepcoach

#endif // STEPCOACH_UI_MODULE_H
