#ifndef STEPCOACH_PRESENTATION_H
#define STEPCOACH_PRESENTATION_H

#include "../planner/plan.h"
#include <string>
#include <functional>

namespace stepcoach {

/**
 * @brief Hooks the engine calls to show progress; any of them may be empty
 *
 * Callbacks run on the engine thread and must return promptly.
 */
struct PresentationCallbacks {
    std::function<void(const std::string&)> onStatus;
    std::function<void(const Step&)> onStepStart;
    std::function<void(const Step&, bool)> onStepComplete;
    std::function<void(const std::string&)> onNeedHelp;
    std::function<void(bool)> onRunComplete;
};

/**
 * @brief Invokes PresentationCallbacks, skipping absent ones
 *
 * An exception thrown by a callback is logged and does not reach the engine.
 */
class Presenter {
public:
    explicit Presenter(const PresentationCallbacks& callbacks);

    void status(const std::string& text) const;
    void stepStart(const Step& step) const;
    void stepComplete(const Step& step, bool success) const;
    void needHelp(const std::string& question) const;
    void runComplete(bool success) const;

private:
    PresentationCallbacks m_callbacks;

    template<typename Fn, typename... Args>
    void dispatch(const char* name, const Fn& callback, Args&&... args) const;
};

} // namespace stepcoach

#endif // STEPCOACH_PRESENTATION_H
