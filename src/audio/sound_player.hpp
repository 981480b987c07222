#pragma once

#include <string>

namespace reveille {

// Plays an alarm tone. Returns false when the resource cannot be played;
// may throw PlaybackError when the audio backend itself fails.
class SoundPlayer
{
public:
    virtual ~SoundPlayer() = default;

    virtual bool play(const std::string &resourceRef) = 0;
};

} // namespace reveille
