#pragma once

#include <chrono>

#include "common/models.hpp"

namespace reveille {

class DeferralEngine
{
public:
    // Builds the follow-up instance of a firing trigger: fires deferDuration
    // after `now` (minute resolution), carries deferCount + 1 and a
    // "(Snooze N)" label suffix. Pure; the input is not modified.
    static Trigger computeDeferral(const Trigger &trigger,
                                   std::chrono::system_clock::time_point now);
};

} // namespace reveille
