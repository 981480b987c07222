#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"
#include "common/time_of_day.hpp"

namespace reveille {

inline std::string toDecisionString(FiringDecision decision)
{
    switch (decision) {
    case FiringDecision::Dismiss:
        return "dismiss";
    case FiringDecision::Defer:
        return "defer";
    }
    return "defer";
}

inline std::string toCauseString(ResolutionCause cause)
{
    switch (cause) {
    case ResolutionCause::UserChoice:
        return "user_choice";
    case ResolutionCause::Timeout:
        return "timeout";
    case ResolutionCause::Interrupt:
        return "interrupt";
    }
    return "user_choice";
}

inline std::string toOutcomeString(FiringOutcome outcome)
{
    switch (outcome) {
    case FiringOutcome::Busy:
        return "busy";
    case FiringOutcome::Dismissed:
        return "dismissed";
    case FiringOutcome::Deferred:
        return "deferred";
    }
    return "busy";
}

inline void to_json(nlohmann::json &j, const TimeOfDay &time)
{
    j = formatTimeOfDay(time);
}

inline void from_json(const nlohmann::json &j, TimeOfDay &time)
{
    if (!j.is_string()) {
        time = TimeOfDay{};
        return;
    }
    const auto parsed = parseTimeOfDay(j.get<std::string>());
    time = parsed.value_or(TimeOfDay{});
}

inline void to_json(nlohmann::json &j, const Trigger &trigger)
{
    j = nlohmann::json{
        {"id", trigger.id},
        {"originId", trigger.originId},
        {"time", trigger.fireTime},
        {"tone", trigger.toneRef},
        {"snoozeMinutes", trigger.deferDuration.count()},
        {"label", trigger.label},
        {"enabled", trigger.enabled},
        {"snoozed", trigger.deferred},
        {"snoozeCount", trigger.deferCount}
    };
}

inline void from_json(const nlohmann::json &j, Trigger &trigger)
{
    trigger.id = j.value("id", TriggerId{0});
    trigger.originId = j.value("originId", trigger.id);
    if (j.contains("time")) {
        trigger.fireTime = j.at("time").get<TimeOfDay>();
    } else {
        trigger.fireTime = TimeOfDay{};
    }
    trigger.toneRef = j.value("tone", "");
    trigger.deferDuration = std::chrono::minutes(j.value("snoozeMinutes", 5));
    trigger.label = j.value("label", "");
    trigger.enabled = j.value("enabled", true);
    trigger.deferred = j.value("snoozed", false);
    trigger.deferCount = j.value("snoozeCount", 0);
}

inline void to_json(nlohmann::json &j, const FiringResult &result)
{
    j = nlohmann::json{
        {"outcome", toOutcomeString(result.outcome)},
        {"cause", toCauseString(result.cause)},
        {"fired", result.fired}
    };
    if (result.followUp.has_value()) {
        j["followUp"] = *result.followUp;
    }
}

} // namespace reveille
