#include "shutdown_manager.h"
#include "structured_logger.h"
#include <csignal>
#include <cstdlib>
#include <unistd.h>

namespace stepcoach {

namespace {

void signalHandler(int signal) {
    if (signal != SIGINT && signal != SIGTERM) {
        return;
    }
    auto& shutdownMgr = ShutdownManager::getInstance();
    if (shutdownMgr.incrementSignalCount() == 1) {
        shutdownMgr.requestShutdown();
        const char notice[] = "\nStopping after the current step - press Ctrl+C again to force exit\n";
        ssize_t ignored = ::write(STDERR_FILENO, notice, sizeof(notice) - 1);
        (void)ignored;
    } else {
        std::_Exit(1);
    }
}

} // anonymous namespace

void ShutdownManager::installSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

ShutdownWatcher::ShutdownWatcher(std::function<void()> onShutdown, std::chrono::milliseconds pollInterval)
    : m_onShutdown(std::move(onShutdown))
    , m_pollInterval(pollInterval)
    , m_stop(false)
    , m_fired(false) {
    m_thread = std::thread(&ShutdownWatcher::watchLoop, this);
}

ShutdownWatcher::~ShutdownWatcher() {
    stop();
}

void ShutdownWatcher::stop() {
    m_stop = true;
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void ShutdownWatcher::watchLoop() {
    while (!m_stop.load()) {
        if (ShutdownManager::getInstance().isShutdownRequested()) {
            m_fired = true;
            SLOG_INFO().message("Shutdown requested, cancelling run");
            if (m_onShutdown) {
                m_onShutdown();
            }
            return;
        }
        std::this_thread::sleep_for(m_pollInterval);
    }
}

} // namespace stepcoach
