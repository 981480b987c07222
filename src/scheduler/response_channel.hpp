#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

#include "common/enums.hpp"

namespace reveille {

// Rendezvous between the firing thread and whoever answers the alarm. The
// firing thread opens the channel, waits with a deadline, and closes it; the
// console posts decisions. Decisions posted while closed are rejected so a
// stray keypress cannot resolve a later alarm.
class ResponseChannel
{
public:
    struct Response {
        ResolutionCause cause = ResolutionCause::UserChoice;
        FiringDecision decision = FiringDecision::Defer;
    };

    void open();
    void close();
    bool isOpen() const;

    // Returns false when no alarm is waiting for an answer.
    bool post(FiringDecision decision);

    // Async-signal-safe: lock-free atomics only. The waiter notices within one
    // poll slice. Returns whether an alarm was open at the time.
    bool requestInterrupt() noexcept;

    // While shut down, every wait ends at once as an interrupt. Survives
    // open(); cleared by resume().
    void shutdown();
    void resume();

    // Waits until a decision, an interrupt or the deadline. A timeout yields
    // {Timeout, Defer}; an interrupt yields {Interrupt, Dismiss}.
    Response await(std::chrono::steady_clock::duration timeout);

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_open = false;
    std::optional<FiringDecision> m_decision;
    std::atomic<bool> m_interruptRequested{false};
    std::atomic<bool> m_shutdown{false};
    // Mirror of m_open readable from a signal handler.
    std::atomic<bool> m_waiting{false};
};

} // namespace reveille
