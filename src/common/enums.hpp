#pragma once

namespace reveille {

// Decision delivered by the console while a trigger is firing.
enum class FiringDecision {
    Dismiss,
    Defer
};

// What ended the decision protocol.
enum class ResolutionCause {
    UserChoice,
    Timeout,
    Interrupt
};

enum class FiringOutcome {
    Busy,
    Dismissed,
    Deferred
};

} // namespace reveille
