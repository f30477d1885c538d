#ifndef STEPCOACH_INPUT_EVENT_SOURCE_H
#define STEPCOACH_INPUT_EVENT_SOURCE_H

#include "../common/thread_safe_queue.h"
#include "../common/clock.h"
#include "../planner/plan.h"
#include <string>
#include <memory>
#include <atomic>
#include <thread>
#include <chrono>
#include <cstdint>

namespace stepcoach {

enum class WaitResult {
    SIGNAL,
    TIMEOUT,
    INTERRUPTED
};

std::string waitResultToString(WaitResult result);

// Opaque "the operator finished the step" event
struct CompletionSignal {
    IClock::TimePoint timestamp;
    std::string payload;
    uint64_t window;
};

/**
 * @brief Where completion signals come from: a human or an actuator
 *
 * beginStep() opens a new signal window for a freshly announced step;
 * signals from earlier windows are discarded. interrupt() wakes a pending
 * waitForSignal() and keeps waking later calls until resetInterrupt().
 */
class IInputEventSource {
public:
    virtual ~IInputEventSource() = default;

    virtual void beginStep(const Step& step) = 0;
    virtual WaitResult waitForSignal(std::chrono::milliseconds timeout) = 0;
    virtual void interrupt() = 0;
    virtual void resetInterrupt() = 0;
};

/**
 * @brief Human mode: producers push signals from any thread
 *
 * The waitForSignal() deadline is measured on the injected clock.
 */
class QueuedInputEventSource : public IInputEventSource {
public:
    explicit QueuedInputEventSource(std::shared_ptr<IClock> clock);
    ~QueuedInputEventSource() override;

    void beginStep(const Step& step) override;
    WaitResult waitForSignal(std::chrono::milliseconds timeout) override;
    void interrupt() override;
    void resetInterrupt() override;

    /**
     * @brief Producer side; stamps the signal with the current window
     */
    void signal(const std::string& payload = "");

    /**
     * @brief Signal on behalf of a specific window; dropped if that window has closed
     */
    bool signalForWindow(uint64_t window, const std::string& payload = "");

    /**
     * @brief Stop accepting signals and release any waiter
     */
    void close();

    size_t pendingSignals() const;
    uint64_t currentWindow() const;
    size_t droppedSignals() const;

private:
    std::shared_ptr<IClock> m_clock;
    ThreadSafeQueue<CompletionSignal> m_signals;
    std::atomic<uint64_t> m_window;
    std::atomic<bool> m_interrupted;
    std::atomic<size_t> m_dropped;
};

/**
 * @brief Performs a step on the machine; returns false if it could not
 */
class IActuator {
public:
    virtual ~IActuator() = default;
    virtual bool perform(const Step& step) = 0;
};

/**
 * @brief Actuator that only logs what it would do
 */
class SimulatedActuator : public IActuator {
public:
    bool perform(const Step& step) override;
    int getPerformedCount() const { return m_performed.load(); }

private:
    std::atomic<int> m_performed{0};
};

/**
 * @brief Autonomous mode: each begun step is performed on a worker thread,
 * which signals completion when the actuator returns
 */
class ActuatorInputEventSource : public IInputEventSource {
public:
    ActuatorInputEventSource(std::shared_ptr<IActuator> actuator, std::shared_ptr<IClock> clock);
    ~ActuatorInputEventSource() override;

    ActuatorInputEventSource(const ActuatorInputEventSource&) = delete;
    ActuatorInputEventSource& operator=(const ActuatorInputEventSource&) = delete;

    void beginStep(const Step& step) override;
    WaitResult waitForSignal(std::chrono::milliseconds timeout) override;
    void interrupt() override;
    void resetInterrupt() override;

    void shutdown();

private:
    struct Job {
        Step step;
        uint64_t window;
    };

    std::shared_ptr<IActuator> m_actuator;
    QueuedInputEventSource m_signals;
    ThreadSafeQueue<Job> m_jobs;
    std::thread m_worker;

    void workerLoop();
};

} // namespace stepcoach

#endif // STEPCOACH_INPUT_EVENT_SOURCE_H
