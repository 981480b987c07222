#include "scheduler/firing_coordinator.hpp"

#include <exception>
#include <utility>

#include <QFileInfo>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "scheduler/deferral_engine.hpp"

#include <nlohmann/json.hpp>

namespace reveille {

FiringCoordinator::FiringCoordinator(TriggerStore &store,
                                     SoundPlayer &player,
                                     SoundPlayer &fallbackCue,
                                     FiringPrompt &prompt,
                                     std::chrono::steady_clock::duration responseTimeout,
                                     Clock clock)
    : m_store(store)
    , m_player(player)
    , m_fallbackCue(fallbackCue)
    , m_prompt(prompt)
    , m_responseTimeout(responseTimeout)
    , m_clock(std::move(clock))
{
}

FiringResult FiringCoordinator::fire(const Trigger &trigger)
{
    if (!claimSlot(trigger)) {
        FiringResult busy;
        busy.outcome = FiringOutcome::Busy;
        busy.fired = trigger;
        return busy;
    }

    logging::CorrelationScope corr(logging::newCorrelationId(QStringLiteral("firing")));
    RLOG_INFO(QStringLiteral("FiringCoordinator"),
              QStringLiteral("fire"),
              QStringLiteral("alarm_firing"),
              QStringLiteral("trigger_due"),
              QStringLiteral("claim_active_slot"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"trigger", trigger}}));

    FiringResult result;
    try {
        playTone(trigger);

        m_channel.open();
        m_prompt.presentFiring(trigger);
        const ResponseChannel::Response response = m_channel.await(m_responseTimeout);
        m_channel.close();

        result = applyResponse(trigger, response);
    } catch (const std::exception &ex) {
        // Unexpected failure inside the protocol: free the slot so the
        // scheduler keeps running, then let the caller report it.
        m_channel.close();
        releaseSlot();
        RLOG_ERROR(QStringLiteral("FiringCoordinator"),
                   QStringLiteral("fire"),
                   QStringLiteral("firing_episode_failed"),
                   QStringLiteral("exception"),
                   QStringLiteral("release_slot"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"error", ex.what()}, {"triggerId", trigger.id}}));
        throw;
    }

    releaseSlot();
    m_prompt.reportOutcome(result);
    return result;
}

void FiringCoordinator::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(m_slotMutex);
        m_accepting = false;
    }
    m_channel.shutdown();
}

void FiringCoordinator::resume()
{
    m_channel.resume();
    std::lock_guard<std::mutex> lock(m_slotMutex);
    m_accepting = true;
}

bool FiringCoordinator::isIdle() const
{
    std::lock_guard<std::mutex> lock(m_slotMutex);
    return !m_active.has_value();
}

std::optional<Trigger> FiringCoordinator::activeTrigger() const
{
    std::lock_guard<std::mutex> lock(m_slotMutex);
    return m_active;
}

ResponseChannel &FiringCoordinator::responseChannel()
{
    return m_channel;
}

bool FiringCoordinator::claimSlot(const Trigger &trigger)
{
    std::lock_guard<std::mutex> lock(m_slotMutex);
    if (!m_accepting || m_active.has_value()) {
        return false;
    }
    m_active = trigger;
    return true;
}

void FiringCoordinator::releaseSlot()
{
    std::lock_guard<std::mutex> lock(m_slotMutex);
    m_active.reset();
}

void FiringCoordinator::playTone(const Trigger &trigger)
{
    bool played = false;
    if (!trigger.toneRef.empty()
        && QFileInfo::exists(QString::fromStdString(trigger.toneRef))) {
        try {
            played = m_player.play(trigger.toneRef);
        } catch (const PlaybackError &ex) {
            RLOG_WARN(QStringLiteral("FiringCoordinator"),
                      QStringLiteral("playTone"),
                      QStringLiteral("playback_failed"),
                      QStringLiteral("audio_backend_error"),
                      QStringLiteral("fallback_cue"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"error", ex.what()}, {"tone", trigger.toneRef}}));
        }
    }

    if (played) {
        return;
    }

    RLOG_DEBUG(QStringLiteral("FiringCoordinator"),
               QStringLiteral("playTone"),
               QStringLiteral("fallback_cue"),
               QStringLiteral("tone_unavailable"),
               QStringLiteral("simulated_beep"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"tone", trigger.toneRef}}));
    try {
        m_fallbackCue.play(trigger.toneRef);
    } catch (const std::exception &ex) {
        RLOG_WARN(QStringLiteral("FiringCoordinator"),
                  QStringLiteral("playTone"),
                  QStringLiteral("fallback_cue_failed"),
                  QStringLiteral("console_error"),
                  QStringLiteral("continue_to_decision"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"error", ex.what()}}));
    }
}

FiringResult FiringCoordinator::applyResponse(const Trigger &trigger,
                                              const ResponseChannel::Response &response)
{
    FiringResult result;
    result.cause = response.cause;
    result.fired = trigger;

    if (response.decision == FiringDecision::Dismiss) {
        result.outcome = FiringOutcome::Dismissed;
        result.fired.deferred = false;
        result.fired.deferCount = 0;
        if (!m_store.resetDeferral(trigger.originId)) {
            RLOG_DEBUG(QStringLiteral("FiringCoordinator"),
                       QStringLiteral("applyResponse"),
                       QStringLiteral("origin_missing"),
                       QStringLiteral("alarm_deleted_while_snoozed"),
                       QStringLiteral("skip_store_update"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"originId", trigger.originId}}));
        }
    } else {
        const Trigger next = DeferralEngine::computeDeferral(trigger, m_clock());
        result.outcome = FiringOutcome::Deferred;
        result.fired.deferred = true;
        result.followUp = next;
        m_store.markDeferred(trigger.originId, next.deferCount);
    }

    RLOG_INFO(QStringLiteral("FiringCoordinator"),
              QStringLiteral("applyResponse"),
              QStringLiteral("alarm_resolved"),
              QString::fromStdString(toCauseString(response.cause)),
              QString::fromStdString(toDecisionString(response.decision)),
              logging::defaultWho(),
              QString(),
              nlohmann::json(result));
    return result;
}

} // namespace reveille
