#include "scheduler/deferral_engine.hpp"

#include <string>

#include "common/time_of_day.hpp"

namespace reveille {

Trigger DeferralEngine::computeDeferral(const Trigger &trigger,
                                        std::chrono::system_clock::time_point now)
{
    Trigger next = trigger;
    next.deferCount = trigger.deferCount + 1;
    next.fireTime = timeOfDayAt(now + trigger.deferDuration);
    next.label = trigger.label + " (Snooze " + std::to_string(next.deferCount) + ")";
    next.deferred = false;
    return next;
}

} // namespace reveille
