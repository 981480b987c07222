#include "console/ConsolePrompt.hpp"

#include <sstream>

#include "common/time_of_day.hpp"

namespace reveille {

ConsolePrompt::ConsolePrompt(ConsoleWriter &writer, std::chrono::seconds responseTimeout)
    : m_writer(writer)
    , m_responseTimeout(responseTimeout)
{
}

void ConsolePrompt::presentFiring(const Trigger &trigger)
{
    std::ostringstream out;
    out << "\n\U0001F6A8 ALARM RINGING: " << trigger.label << " \U0001F6A8\n"
        << "Time: " << formatTimeOfDay(trigger.fireTime) << "\n\n"
        << "⏰ Alarm: " << trigger.label << "\n"
        << "1. Dismiss Alarm\n"
        << "2. Snooze Alarm\n"
        << "Enter your choice (1-2) or press Enter to snooze"
        << " (auto-snooze in " << m_responseTimeout.count() << "s): ";
    m_writer.write(out.str());
}

void ConsolePrompt::reportOutcome(const FiringResult &result)
{
    std::ostringstream out;
    if (result.outcome == FiringOutcome::Dismissed) {
        if (result.cause == ResolutionCause::Interrupt) {
            out << "\n✅ Alarm dismissed via keyboard interrupt.\n";
        } else {
            out << "✅ Alarm dismissed.\n";
        }
    } else if (result.outcome == FiringOutcome::Deferred && result.followUp.has_value()) {
        if (result.cause == ResolutionCause::Timeout) {
            out << "\n⏰ No response received.\n";
        }
        out << "\U0001F634 Alarm snoozed for " << result.fired.deferDuration.count()
            << " minutes.\n"
            << "   Snooze count: " << result.followUp->deferCount << "\n"
            << "   Next ring: " << formatTimeOfDay(result.followUp->fireTime) << "\n";
    }
    m_writer.write(out.str());
}

} // namespace reveille
