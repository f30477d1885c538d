#include "clock.h"
#include <thread>

namespace stepcoach {

IClock::TimePoint SteadyClock::now() const {
    return std::chrono::steady_clock::now();
}

void SteadyClock::sleepFor(std::chrono::milliseconds duration) {
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}

ManualClock::ManualClock()
    : m_now(std::chrono::steady_clock::time_point{} + std::chrono::hours(1))
    , m_slept(0) {}

IClock::TimePoint ManualClock::now() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_now;
}

void ManualClock::sleepFor(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_now += duration;
    m_slept += duration;
}

void ManualClock::advance(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_now += duration;
}

std::chrono::milliseconds ManualClock::totalSlept() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slept;
}

} // namespace stepcoach
