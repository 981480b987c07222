#pragma once

#include <functional>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

#include "audio/tone_library.hpp"
#include "console/ConsoleOutput.hpp"
#include "scheduler/firing_coordinator.hpp"
#include "scheduler/scheduler_loop.hpp"
#include "scheduler/trigger_repository.hpp"
#include "scheduler/trigger_store.hpp"

namespace reveille {

// Parses an answer to a ringing alarm: "1"/"dismiss", or "2"/"snooze"/empty
// line for snooze. Words are case-insensitive.
std::optional<FiringDecision> parseDecision(const std::string &line);

// Runs body and returns its exit code. An exception escaping body is logged,
// reported on err and turned into exit code 1.
int runReportingFailure(const std::function<int()> &body, std::ostream &err);

class ConsoleApp
{
public:
    // repository may be null when persistence is disabled.
    ConsoleApp(std::istream &in,
               ConsoleWriter &out,
               TriggerStore &store,
               SchedulerLoop &scheduler,
               FiringCoordinator &coordinator,
               const ToneLibrary &tones,
               TriggerRepository *repository);

    // Menu loop. Returns when the user exits, input ends, or Ctrl+C is
    // pressed at a prompt while no alarm is ringing. Returns the exit code.
    int run();

    // Operations behind the menu entries; indexes are 0-based.
    TriggerId addTrigger(const Trigger &trigger);
    TriggerListing listTriggers() const;
    bool toggle(int index);
    Trigger remove(int index);

private:
    // Reads one line for a prompt. Lines typed while an alarm is ringing are
    // consumed as the alarm's answer and the prompt is repeated.
    std::string readLine(const std::string &prompt);
    bool routeAlarmResponse(const std::string &line);
    bool confirm(const std::string &question);

    void displayMenu();
    void setAlarm();
    std::string selectTone();
    std::string uploadCustomTone();
    int selectSnoozeDuration();
    void viewAlarms();
    void manageAlarms();
    void toggleAlarm();
    void deleteAlarm();
    void showHelp();
    std::optional<int> readAlarmIndex(const std::string &prompt);

    void persist();

    std::istream &m_in;
    ConsoleWriter &m_out;
    TriggerStore &m_store;
    SchedulerLoop &m_scheduler;
    FiringCoordinator &m_coordinator;
    const ToneLibrary &m_tones;
    TriggerRepository *m_repository;
};

} // namespace reveille
