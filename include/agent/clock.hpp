#pragma once

#include <chrono>

namespace agent {

// Every timed wait of the agent goes through a Clock so tests can run the
// polling loops in virtual time.
class Clock {
public:
    using Duration = std::chrono::milliseconds;
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;
    virtual void sleep_for(Duration duration) = 0;

    Duration elapsed_since(TimePoint start) const {
        return std::chrono::duration_cast<Duration>(now() - start);
    }
};

class SystemClock : public Clock {
public:
    TimePoint now() const override;
    void sleep_for(Duration duration) override;
};

} // namespace agent
