#include "scheduler/response_channel.hpp"

#include <algorithm>

namespace reveille {

namespace {

// Upper bound on how long an interrupt raised from a signal handler can go
// unnoticed; the handler cannot notify the condition variable itself.
constexpr auto kInterruptPollSlice = std::chrono::milliseconds(100);

} // namespace

void ResponseChannel::open()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_open = true;
    m_decision.reset();
    m_interruptRequested.store(false);
    m_waiting.store(true);
}

void ResponseChannel::close()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_open = false;
    m_decision.reset();
    m_waiting.store(false);
}

bool ResponseChannel::isOpen() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_open;
}

bool ResponseChannel::post(FiringDecision decision)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_open || m_decision.has_value()) {
            return false;
        }
        m_decision = decision;
    }
    m_cv.notify_all();
    return true;
}

bool ResponseChannel::requestInterrupt() noexcept
{
    m_interruptRequested.store(true);
    return m_waiting.load();
}

void ResponseChannel::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown.store(true);
    }
    m_cv.notify_all();
}

void ResponseChannel::resume()
{
    m_shutdown.store(false);
}

ResponseChannel::Response ResponseChannel::await(std::chrono::steady_clock::duration timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::unique_lock<std::mutex> lock(m_mutex);
    while (true) {
        if (m_interruptRequested.exchange(false) || m_shutdown.load()) {
            return Response{ResolutionCause::Interrupt, FiringDecision::Dismiss};
        }
        if (m_decision.has_value()) {
            const FiringDecision decision = *m_decision;
            m_decision.reset();
            return Response{ResolutionCause::UserChoice, decision};
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return Response{ResolutionCause::Timeout, FiringDecision::Defer};
        }
        const auto slice = std::min<std::chrono::steady_clock::duration>(
            deadline - now, kInterruptPollSlice);
        m_cv.wait_for(lock, slice, [this] {
            return m_decision.has_value() || m_interruptRequested.load()
                || m_shutdown.load();
        });
    }
}

} // namespace reveille
