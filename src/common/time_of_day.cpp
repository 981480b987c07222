#include "common/time_of_day.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <exception>
#include <iomanip>
#include <sstream>

namespace reveille {

namespace {

constexpr std::size_t kMaxSegmentDigits = 4;

std::string trim(const std::string &value)
{
    const auto first = std::find_if_not(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    const auto last = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();
    if (first >= last) {
        return {};
    }
    return std::string(first, last);
}

bool isDigits(const std::string &value)
{
    if (value.empty() || value.size() > kMaxSegmentDigits) {
        return false;
    }
    return std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isdigit(c);
    });
}

std::tm toLocalTm(std::chrono::system_clock::time_point t)
{
    std::time_t raw = std::chrono::system_clock::to_time_t(t);
    std::tm localTime{};
#if defined(_WIN32)
    localtime_s(&localTime, &raw);
#else
    localtime_r(&raw, &localTime);
#endif
    return localTime;
}

} // namespace

std::optional<TimeOfDay> parseTimeOfDay(const std::string &value)
{
    const std::string trimmed = trim(value);
    const auto colon = trimmed.find(':');
    if (colon == std::string::npos || trimmed.find(':', colon + 1) != std::string::npos) {
        return std::nullopt;
    }

    const std::string hourPart = trimmed.substr(0, colon);
    const std::string minutePart = trimmed.substr(colon + 1);
    if (!isDigits(hourPart) || !isDigits(minutePart)) {
        return std::nullopt;
    }

    TimeOfDay time;
    try {
        time.hour = std::stoi(hourPart);
        time.minute = std::stoi(minutePart);
    } catch (const std::exception &) {
        return std::nullopt;
    }
    if (time.hour < 0 || time.hour > 23 || time.minute < 0 || time.minute > 59) {
        return std::nullopt;
    }
    return time;
}

bool validateTime(const std::string &value)
{
    return parseTimeOfDay(value).has_value();
}

std::string formatTimeOfDay(const TimeOfDay &time)
{
    std::ostringstream out;
    out << std::setw(2) << std::setfill('0') << time.hour << ":"
        << std::setw(2) << std::setfill('0') << time.minute;
    return out.str();
}

TimeOfDay timeOfDayAt(std::chrono::system_clock::time_point t)
{
    const std::tm localTime = toLocalTm(t);
    return TimeOfDay{localTime.tm_hour, localTime.tm_min};
}

std::int64_t minuteStamp(std::chrono::system_clock::time_point t)
{
    return std::chrono::duration_cast<std::chrono::minutes>(t.time_since_epoch()).count();
}

std::chrono::system_clock::time_point localTimeToday(int hour, int minute, int second)
{
    std::tm localTime = toLocalTm(std::chrono::system_clock::now());
    localTime.tm_hour = hour;
    localTime.tm_min = minute;
    localTime.tm_sec = second;
    localTime.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&localTime));
}

} // namespace reveille
