#include "agent/clock.hpp"
#include <thread>

namespace agent {

Clock::TimePoint SystemClock::now() const {
    return std::chrono::steady_clock::now();
}

void SystemClock::sleep_for(Duration duration) {
    std::this_thread::sleep_for(duration);
}

} // namespace agent
