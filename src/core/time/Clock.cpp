#include "Clock.hpp"

#include <thread>

namespace ferry {

Clock::time_point SystemClock::Now() const {
    return std::chrono::system_clock::now();
}

void SystemClock::SleepFor(duration d) {
    if (d > duration::zero()) {
        std::this_thread::sleep_for(d);
    }
}

std::int64_t ToEpochMillis(Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

Clock::time_point FromEpochMillis(std::int64_t ms) {
    return Clock::time_point{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds{ms})};
}

}  // namespace ferry
