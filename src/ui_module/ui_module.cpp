#include "ui_module.h"
#include "../common/structured_logger.h"
#include "../common/string_utils.h"

namespace stepcoach {

namespace {
const size_t MAX_MESSAGE_LENGTH = 2000;
}

UIModule::UIModule(std::ostream& out)
    : m_out(out) {
    SLOG_DEBUG().message("UIModule initialized");
}

PresentationCallbacks UIModule::callbacks() {
    PresentationCallbacks callbacks;
    callbacks.onStatus = [this](const std::string& text) { displayFeedback(text); };
    callbacks.onStepStart = [this](const Step& step) { displayStep(step); };
    callbacks.onStepComplete = [this](const Step& step, bool success) { displayStepResult(step, success); };
    callbacks.onNeedHelp = [this](const std::string& question) { displayHelpPrompt(question); };
    callbacks.onRunComplete = [this](bool success) {
        writeLine("[Coach]: ", success ? "Well done!" : "Stopping here.");
    };
    return callbacks;
}

void UIModule::writeLine(const std::string& prefix, const std::string& text) {
    std::string line = text;
    if (line.length() > MAX_MESSAGE_LENGTH) {
        SLOG_WARNING().message("Message exceeds maximum length")
            .context("length", line.length())
            .context("max_length", MAX_MESSAGE_LENGTH);
        line = utils::StringUtils::truncateUtf8(line, MAX_MESSAGE_LENGTH) + "... [truncated]";
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_out << prefix << line << std::endl;
}

void UIModule::displayFeedback(const std::string& message) {
    if (utils::StringUtils::isWhitespaceOnly(message)) {
        SLOG_WARNING().message("Attempted to display empty feedback message");
        return;
    }
    writeLine("[Coach]: ", message);
}

void UIModule::displayStep(const Step& step) {
    writeLine("", "");
    writeLine("Step " + std::to_string(step.number) + ": ", step.describe());
    if (!step.visualHint.empty()) {
        writeLine("        ", "Where: " + step.visualHint);
    }
    if (!step.expectedResult.empty()) {
        writeLine("        ", "You should see: " + step.expectedResult);
    }
    writeLine("        ", "Press Enter when you have done this, or type what went wrong.");
}

void UIModule::displayStepResult(const Step& step, bool success) {
    writeLine(success ? "  [OK] " : "  [..] ",
              "Step " + std::to_string(step.number) + (success ? " done." : " not confirmed yet."));
}

void UIModule::displayHelpPrompt(const std::string& question) {
    writeLine("[Coach]: ", question + " Type what you see, or press Enter once it is done.");
}

void UIModule::displayPlan(const Plan& plan) {
    if (plan.isEmpty()) {
        writeLine("[Coach]: ", "No plan could be made for this goal.");
        return;
    }
    writeLine("[Coach]: ", "Plan for \"" + plan.intent.goal + "\":");
    for (const auto& step : plan.steps) {
        writeLine("  " + std::to_string(step.number) + ". ", step.describe());
    }
}

void UIModule::displayResult(const RunResult& result) {
    writeLine("", "");
    writeLine(result.success ? "[Done]: " : "[Stopped]: ", result.message);
    writeLine("        ", std::to_string(result.completedSteps.size()) + " steps completed, " +
                          std::to_string(result.statistics.retries) + " retries, " +
                          std::to_string(result.statistics.replans) + " new plans.");
}

ConsoleInputListener::ConsoleInputListener(std::istream& in,
                                           std::function<void()> onSignal,
                                           std::function<void(const std::string&)> onFeedback)
    : m_in(in)
    , m_state(std::make_shared<State>()) {
    m_state->onSignal = std::move(onSignal);
    m_state->onFeedback = std::move(onFeedback);
}

ConsoleInputListener::~ConsoleInputListener() {
    stop();
}

void ConsoleInputListener::start() {
    if (m_thread.joinable()) {
        return;
    }
    m_thread = std::thread(&ConsoleInputListener::readLoop, std::ref(m_in), m_state);
}

void ConsoleInputListener::stop() {
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->stopped = true;
    }
    // A thread blocked in getline cannot be woken portably; it exits on its next line
    if (m_thread.joinable()) {
        m_thread.detach();
    }
}

void ConsoleInputListener::waitForEnd() {
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void ConsoleInputListener::readLoop(std::istream& in, std::shared_ptr<State> state) {
    std::string line;
    while (std::getline(in, line)) {
        std::string text = utils::StringUtils::trim(line);

        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->stopped) {
            return;
        }
        try {
            if (text.empty()) {
                if (state->onSignal) state->onSignal();
            } else {
                SLOG_DEBUG().message("Console feedback line").context("length", text.length());
                if (state->onFeedback) state->onFeedback(text);
            }
        } catch (const std::exception& e) {
            SLOG_ERROR().message("Console input handler failed").context("error", e.what());
        }
    }
    SLOG_DEBUG().message("Console input closed");
}

} // namespace stepcoach
