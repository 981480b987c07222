#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>

#include "audio/sound_player.hpp"
#include "common/models.hpp"
#include "scheduler/response_channel.hpp"
#include "scheduler/trigger_store.hpp"

namespace reveille {

// Presentation side of a firing episode. presentFiring() is called with the
// response channel already open, so an implementation may answer at once.
class FiringPrompt
{
public:
    virtual ~FiringPrompt() = default;

    virtual void presentFiring(const Trigger &trigger) = 0;
    virtual void reportOutcome(const FiringResult &result) = 0;
};

/**
 * FiringCoordinator owns the single "currently firing" slot.
 *
 * fire() claims the slot, plays the tone (falling back to the console cue),
 * waits for a decision on the response channel with a deadline, applies the
 * outcome to the store member the trigger derives from, and releases the slot.
 * A deferral yields the follow-up trigger in FiringResult::followUp; the caller
 * is responsible for watching it.
 */
class FiringCoordinator
{
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    FiringCoordinator(TriggerStore &store,
                      SoundPlayer &player,
                      SoundPlayer &fallbackCue,
                      FiringPrompt &prompt,
                      std::chrono::steady_clock::duration responseTimeout,
                      Clock clock = [] { return std::chrono::system_clock::now(); });

    FiringCoordinator(const FiringCoordinator &) = delete;
    FiringCoordinator &operator=(const FiringCoordinator &) = delete;

    // Returns outcome Busy without side effects if another trigger is firing.
    FiringResult fire(const Trigger &trigger);

    // shutdown() interrupts the active episode (treated as a dismiss) and makes
    // further fire() calls return Busy until resume().
    void shutdown();
    void resume();

    bool isIdle() const;
    std::optional<Trigger> activeTrigger() const;

    ResponseChannel &responseChannel();

private:
    bool claimSlot(const Trigger &trigger);
    void releaseSlot();
    void playTone(const Trigger &trigger);
    FiringResult applyResponse(const Trigger &trigger,
                               const ResponseChannel::Response &response);

    TriggerStore &m_store;
    SoundPlayer &m_player;
    SoundPlayer &m_fallbackCue;
    FiringPrompt &m_prompt;
    std::chrono::steady_clock::duration m_responseTimeout;
    Clock m_clock;

    ResponseChannel m_channel;

    mutable std::mutex m_slotMutex;
    std::optional<Trigger> m_active;
    bool m_accepting = true;
};

} // namespace reveille
