#include "presentation.h"
#include "../common/structured_logger.h"

namespace stepcoach {

Presenter::Presenter(const PresentationCallbacks& callbacks)
    : m_callbacks(callbacks) {}

template<typename Fn, typename... Args>
void Presenter::dispatch(const char* name, const Fn& callback, Args&&... args) const {
    if (!callback) {
        return;
    }
    try {
        callback(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        SLOG_WARNING().message("Presentation callback threw")
            .context("callback", name)
            .context("error", e.what());
    }
}

void Presenter::status(const std::string& text) const {
    dispatch("onStatus", m_callbacks.onStatus, text);
}

void Presenter::stepStart(const Step& step) const {
    dispatch("onStepStart", m_callbacks.onStepStart, step);
}

void Presenter::stepComplete(const Step& step, bool success) const {
    dispatch("onStepComplete", m_callbacks.onStepComplete, step, success);
}

void Presenter::needHelp(const std::string& question) const {
    dispatch("onNeedHelp", m_callbacks.onNeedHelp, question);
}

void Presenter::runComplete(bool success) const {
    dispatch("onRunComplete", m_callbacks.onRunComplete, success);
}

} // namespace stepcoach
