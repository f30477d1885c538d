#ifndef STEPCOACH_CLOCK_H
#define STEPCOACH_CLOCK_H

#include <chrono>
#include <mutex>

namespace stepcoach {

/**
 * @brief Time source for every engine wait that is not a signal wait
 *
 * The engine reads timestamps and performs its loading backoff and settle
 * delays through this interface so they can be replayed without sleeping.
 */
class IClock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~IClock() = default;
    virtual TimePoint now() const = 0;
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

class SteadyClock : public IClock {
public:
    TimePoint now() const override;
    void sleepFor(std::chrono::milliseconds duration) override;
};

/**
 * @brief Clock that only moves when told to; sleeping advances it instantly
 */
class ManualClock : public IClock {
public:
    ManualClock();

    TimePoint now() const override;
    void sleepFor(std::chrono::milliseconds duration) override;

    void advance(std::chrono::milliseconds duration);
    std::chrono::milliseconds totalSlept() const;

private:
    mutable std::mutex m_mutex;
    TimePoint m_now;
    std::chrono::milliseconds m_slept;
};

} // namespace stepcoach

#endif // STEPCOACH_CLOCK_H
