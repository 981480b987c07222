#pragma once

#include "scheduler/response_channel.hpp"

namespace reveille {

enum class InterruptKind {
    None,
    DuringAlarm,
    AtMenu
};

// Installs a SIGINT handler (without SA_RESTART, so a blocked read returns)
// that dismisses the alarm waiting on `channel`, if any, and records what the
// interrupt hit. The channel must outlive the handler.
void installInterruptHandler(ResponseChannel &channel);

// Returns and clears the last recorded interrupt. Also clears the stdin error
// indicator left behind by the interrupted read.
InterruptKind takePendingInterrupt();

} // namespace reveille
