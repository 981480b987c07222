#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "common/enums.hpp"

namespace reveille {

using TriggerId = std::uint64_t;

struct TimeOfDay {
    int hour = 0;
    int minute = 0;

    bool operator==(const TimeOfDay &other) const
    {
        return hour == other.hour && minute == other.minute;
    }

    bool operator!=(const TimeOfDay &other) const
    {
        return !(*this == other);
    }
};

struct Trigger {
    TriggerId id = 0;
    // Store member this instance derives from; equal to id for store members.
    TriggerId originId = 0;

    TimeOfDay fireTime;
    std::string toneRef;
    std::chrono::minutes deferDuration{5};
    std::string label;

    bool enabled = true;
    bool deferred = false;
    int deferCount = 0;
};

struct FiringResult {
    FiringOutcome outcome = FiringOutcome::Busy;
    ResolutionCause cause = ResolutionCause::UserChoice;
    Trigger fired;
    // Set when outcome == Deferred: the instance the scheduler must watch next.
    std::optional<Trigger> followUp;
};

} // namespace reveille
