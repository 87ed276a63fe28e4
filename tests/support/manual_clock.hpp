#pragma once

#include "agent/clock.hpp"
#include <functional>
#include <vector>

namespace fakes {

// Virtual time: sleep_for advances the clock instantly, then runs on_sleep so a
// test can let "the rest of the world" act between two polls.
class ManualClock : public agent::Clock {
public:
    TimePoint now() const override { return now_; }

    void sleep_for(Duration duration) override {
        now_ += duration;
        sleeps.push_back(duration);
        if (on_sleep) on_sleep();
    }

    void advance(Duration duration) { now_ += duration; }

    std::function<void()> on_sleep;
    std::vector<Duration> sleeps;

private:
    TimePoint now_{};
};

} // namespace fakes
