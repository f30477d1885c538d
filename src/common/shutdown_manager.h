#ifndef STEPCOACH_SHUTDOWN_MANAGER_H
#define STEPCOACH_SHUTDOWN_MANAGER_H

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

namespace stepcoach {

/**
 * @brief Process-wide shutdown flag set from SIGINT/SIGTERM
 *
 * The signal handler only touches atomics. A second signal exits the
 * process immediately.
 */
class ShutdownManager {
public:
    static ShutdownManager& getInstance() {
        static ShutdownManager instance;
        return instance;
    }

    void requestShutdown() {
        m_shutdown_requested = true;
    }

    bool isShutdownRequested() const {
        return m_shutdown_requested.load();
    }

    int incrementSignalCount() {
        return ++m_signal_count;
    }

    int getSignalCount() const {
        return m_signal_count.load();
    }

    void reset() {
        m_shutdown_requested = false;
        m_signal_count = 0;
    }

    /**
     * @brief Route SIGINT and SIGTERM to this manager
     */
    static void installSignalHandlers();

private:
    ShutdownManager() : m_shutdown_requested(false), m_signal_count(0) {}

    std::atomic<bool> m_shutdown_requested;
    std::atomic<int> m_signal_count;
};

/**
 * @brief Polls the shutdown flag on a background thread and runs a callback once
 *
 * Used to turn Ctrl+C into ExecutionEngine::cancel() outside signal context.
 */
class ShutdownWatcher {
public:
    explicit ShutdownWatcher(std::function<void()> onShutdown,
                             std::chrono::milliseconds pollInterval = std::chrono::milliseconds(100));
    ~ShutdownWatcher();

    ShutdownWatcher(const ShutdownWatcher&) = delete;
    ShutdownWatcher& operator=(const ShutdownWatcher&) = delete;

    void stop();
    bool fired() const { return m_fired.load(); }

private:
    std::function<void()> m_onShutdown;
    std::chrono::milliseconds m_pollInterval;
    std::atomic<bool> m_stop;
    std::atomic<bool> m_fired;
    std::thread m_thread;

    void watchLoop();
};

} // namespace stepcoach

#endif // STEPCOACH_SHUTDOWN_MANAGER_H
