#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "common/models.hpp"

namespace reveille {

// Parses "HH:MM" (24-hour). Both segments must be plain digits; hour 0-23,
// minute 0-59. Surrounding whitespace is ignored.
std::optional<TimeOfDay> parseTimeOfDay(const std::string &value);

bool validateTime(const std::string &value);

// Zero-padded "HH:MM".
std::string formatTimeOfDay(const TimeOfDay &time);

// Local wall-clock hour and minute of a time point; seconds are dropped.
TimeOfDay timeOfDayAt(std::chrono::system_clock::time_point t);

// Minutes since the epoch, used to key "already fired this minute".
std::int64_t minuteStamp(std::chrono::system_clock::time_point t);

// Local time point for today's date at hour:minute:second. Used by tests and
// by the console clock header.
std::chrono::system_clock::time_point localTimeToday(int hour, int minute, int second = 0);

} // namespace reveille
