#pragma once

#include <chrono>
#include <cstdint>

namespace ferry {

/**
 * @brief Time source used by the broker, orchestrator and engine.
 *
 * Every wait (retry backoff, session window) goes through SleepFor so that a
 * test clock can advance time without blocking.
 *
 * **Thread Safety:** Implementations must be callable from engine workers.
 */
class Clock {
   public:
    using time_point = std::chrono::system_clock::time_point;
    using duration = std::chrono::system_clock::duration;

    virtual ~Clock() = default;

    virtual time_point Now() const = 0;
    virtual void SleepFor(duration d) = 0;
};

class SystemClock final : public Clock {
   public:
    time_point Now() const override;
    void SleepFor(duration d) override;
};

// Milliseconds since the Unix epoch, the on-store representation of times.
std::int64_t ToEpochMillis(Clock::time_point tp);
Clock::time_point FromEpochMillis(std::int64_t ms);

}  // namespace ferry
