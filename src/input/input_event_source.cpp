#include "input_event_source.h"
#include "../common/structured_logger.h"
#include "../common/error_handler.h"
#include <algorithm>

namespace stepcoach {

namespace {

const std::chrono::milliseconds kClockPollSlice(50);

} // anonymous namespace

std::string waitResultToString(WaitResult result) {
    switch (result) {
        case WaitResult::SIGNAL: return "SIGNAL";
        case WaitResult::TIMEOUT: return "TIMEOUT";
        case WaitResult::INTERRUPTED: return "INTERRUPTED";
    }
    return "UNKNOWN";
}

QueuedInputEventSource::QueuedInputEventSource(std::shared_ptr<IClock> clock)
    : m_clock(std::move(clock))
    , m_window(0)
    , m_interrupted(false)
    , m_dropped(0) {

    if (!m_clock) {
        STEPCOACH_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::HIGH,
                        "QueuedInputEventSource requires a clock", "",
                        "QueuedInputEventSource::QueuedInputEventSource");
    }
}

QueuedInputEventSource::~QueuedInputEventSource() {
    close();
}

void QueuedInputEventSource::beginStep(const Step& step) {
    uint64_t window = ++m_window;
    size_t dropped = m_signals.removeIf([window](const CompletionSignal& signal) {
        return signal.window < window;
    });
    m_dropped += dropped;

    SLOG_DEBUG().message("Signal window opened")
        .context("step_number", step.number)
        .context("window", window)
        .context("dropped_signals", dropped);
}

WaitResult QueuedInputEventSource::waitForSignal(std::chrono::milliseconds timeout) {
    const IClock::TimePoint deadline = m_clock->now() + timeout;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - m_clock->now());
        if (remaining.count() < 0) {
            remaining = std::chrono::milliseconds(0);
        }

        // Block in short slices so a clock that is moved by hand is noticed
        auto slice = std::min(remaining, kClockPollSlice);
        auto signal = m_signals.popWithTimeout(slice, [this] { return m_interrupted.load(); });
        if (m_interrupted.load()) {
            return WaitResult::INTERRUPTED;
        }
        if (signal) {
            if (signal->window == m_window.load()) {
                return WaitResult::SIGNAL;
            }
            // Raced with beginStep(): belongs to a closed window
            ++m_dropped;
            continue;
        }
        if (m_signals.isClosed() || m_clock->now() >= deadline) {
            return WaitResult::TIMEOUT;
        }
    }
}

void QueuedInputEventSource::interrupt() {
    m_interrupted = true;
    m_signals.notifyAll();
}

void QueuedInputEventSource::resetInterrupt() {
    m_interrupted = false;
}

void QueuedInputEventSource::signal(const std::string& payload) {
    CompletionSignal completion{m_clock->now(), payload, m_window.load()};
    if (!m_signals.push(completion)) {
        SLOG_DEBUG().message("Signal after close ignored");
    }
}

bool QueuedInputEventSource::signalForWindow(uint64_t window, const std::string& payload) {
    if (window != m_window.load()) {
        ++m_dropped;
        return false;
    }
    CompletionSignal completion{m_clock->now(), payload, window};
    return m_signals.push(completion);
}

void QueuedInputEventSource::close() {
    m_signals.close();
}

size_t QueuedInputEventSource::pendingSignals() const {
    return m_signals.size();
}

uint64_t QueuedInputEventSource::currentWindow() const {
    return m_window.load();
}

size_t QueuedInputEventSource::droppedSignals() const {
    return m_dropped.load();
}

bool SimulatedActuator::perform(const Step& step) {
    ++m_performed;
    SLOG_INFO().message("Simulated action")
        .context("step_number", step.number)
        .context("action", step.skill.describe())
        .context("skill", step.skill.toJson());
    return true;
}

ActuatorInputEventSource::ActuatorInputEventSource(std::shared_ptr<IActuator> actuator, std::shared_ptr<IClock> clock)
    : m_actuator(std::move(actuator))
    , m_signals(std::move(clock)) {

    if (!m_actuator) {
        STEPCOACH_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::HIGH,
                        "ActuatorInputEventSource requires an actuator", "",
                        "ActuatorInputEventSource::ActuatorInputEventSource");
    }
    m_worker = std::thread(&ActuatorInputEventSource::workerLoop, this);
}

ActuatorInputEventSource::~ActuatorInputEventSource() {
    shutdown();
}

void ActuatorInputEventSource::beginStep(const Step& step) {
    m_signals.beginStep(step);
    m_jobs.push(Job{step, m_signals.currentWindow()});
}

WaitResult ActuatorInputEventSource::waitForSignal(std::chrono::milliseconds timeout) {
    return m_signals.waitForSignal(timeout);
}

void ActuatorInputEventSource::interrupt() {
    m_signals.interrupt();
}

void ActuatorInputEventSource::resetInterrupt() {
    m_signals.resetInterrupt();
}

void ActuatorInputEventSource::shutdown() {
    m_jobs.close();
    if (m_worker.joinable()) {
        m_worker.join();
    }
    m_signals.close();
}

void ActuatorInputEventSource::workerLoop() {
    while (auto job = m_jobs.pop()) {
        bool performed = false;
        try {
            performed = m_actuator->perform(job->step);
        } catch (const std::exception& e) {
            ErrorHandler::getInstance().handleException(e, "ActuatorInputEventSource::workerLoop");
        }

        if (!performed) {
            SLOG_WARNING().message("Actuator could not perform step")
                .context("step_number", job->step.number);
        }
        m_signals.signalForWindow(job->window, performed ? "performed" : "failed");
    }
}

} // namespace stepcoach
