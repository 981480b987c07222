#include "console/ConsoleApp.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

#include <QFileInfo>
#include <QString>
#include <QTime>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/time_of_day.hpp"
#include "console/InterruptBridge.hpp"

#include <nlohmann/json.hpp>

namespace reveille {

namespace {

const std::string kRule(50, '=');

// Thrown by readLine() when stdin is exhausted or Ctrl+C hits a plain prompt.
class InputClosed : public std::runtime_error {
public:
    explicit InputClosed(bool interrupted)
        : std::runtime_error("console input closed")
        , m_interrupted(interrupted)
    {
    }

    bool interrupted() const
    {
        return m_interrupted;
    }

private:
    bool m_interrupted;
};

std::string trim(const std::string &value)
{
    return QString::fromStdString(value).trimmed().toStdString();
}

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::optional<int> parseInt(const std::string &value)
{
    bool ok = false;
    const int parsed = QString::fromStdString(value).trimmed().toInt(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return parsed;
}

std::string toneBaseName(const std::string &path)
{
    return QFileInfo(QString::fromStdString(path)).fileName().toStdString();
}

std::string helpText()
{
    return R"(
        ===============================================
                    REVEILLE HELP
        ===============================================

        SETTING ALARMS:
        - Use 24-hour format (e.g., 14:30 for 2:30 PM)
        - Choose from 4 default tones or use a custom audio file
        - Set a snooze duration (1-60 minutes)
        - Add descriptive labels for easy identification

        ALARM TONES:
        - Default tones are stored in the tone directory
          (--tone-dir or REVEILLE_TONE_DIR)
        - Supported custom formats: .wav, .mp3, .ogg, .m4a
        - Without an audio player the alarm beeps on screen

        SNOOZE FEATURE:
        - Snooze postpones the alarm by its snooze duration
        - Each alarm tracks how often it was snoozed
        - An alarm left unanswered is snoozed automatically

        ALARM MANAGEMENT:
        - View all alarms with their status
        - Enable/disable alarms without deleting them
        - Delete alarms you no longer need
        - Alarms are saved and restored on the next start

        KEYBOARD SHORTCUTS:
        - Ctrl+C: dismiss a ringing alarm / leave the program
        - Enter:  quick snooze while an alarm is ringing

        ===============================================
)";
}

} // namespace

std::optional<FiringDecision> parseDecision(const std::string &line)
{
    const std::string answer = toLower(trim(line));
    if (answer == "1" || answer == "dismiss") {
        return FiringDecision::Dismiss;
    }
    if (answer == "2" || answer.empty() || answer == "snooze") {
        return FiringDecision::Defer;
    }
    return std::nullopt;
}

int runReportingFailure(const std::function<int()> &body, std::ostream &err)
{
    try {
        return body();
    } catch (const std::exception &ex) {
        RLOG_ERROR(QStringLiteral("ConsoleApp"),
                   QStringLiteral("runReportingFailure"),
                   QStringLiteral("reveille_failed"),
                   QStringLiteral("exception"),
                   QStringLiteral("exit"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"error", ex.what()}}));
        err << "❌ " << ex.what() << std::endl;
        return 1;
    }
}

ConsoleApp::ConsoleApp(std::istream &in,
                       ConsoleWriter &out,
                       TriggerStore &store,
                       SchedulerLoop &scheduler,
                       FiringCoordinator &coordinator,
                       const ToneLibrary &tones,
                       TriggerRepository *repository)
    : m_in(in)
    , m_out(out)
    , m_store(store)
    , m_scheduler(scheduler)
    , m_coordinator(coordinator)
    , m_tones(tones)
    , m_repository(repository)
{
}

int ConsoleApp::run()
{
    m_out.writeLine("\U0001F514 Welcome to Reveille!");

    while (true) {
        try {
            displayMenu();
            const std::string choice = readLine("\nEnter your choice (1-5): ");

            if (choice == "1") {
                setAlarm();
            } else if (choice == "2") {
                viewAlarms();
            } else if (choice == "3") {
                manageAlarms();
            } else if (choice == "4") {
                showHelp();
            } else if (choice == "5") {
                m_out.writeLine("\U0001F44B Goodbye! All alarms have been stopped.");
                return 0;
            } else {
                m_out.writeLine("❌ Invalid choice. Please select 1-5.");
            }
        } catch (const InputClosed &closed) {
            if (closed.interrupted()) {
                m_out.writeLine("\n\n\U0001F6D1 Program interrupted by user.");
            }
            return 0;
        } catch (const std::exception &ex) {
            RLOG_ERROR(QStringLiteral("ConsoleApp"),
                       QStringLiteral("run"),
                       QStringLiteral("menu_action_failed"),
                       QStringLiteral("exception"),
                       QStringLiteral("continue_loop"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"error", ex.what()}}));
            m_out.writeLine(std::string("❌ An error occurred: ") + ex.what());
            m_out.writeLine("The program will continue running.");
        }
    }
}

TriggerId ConsoleApp::addTrigger(const Trigger &trigger)
{
    const TriggerId id = m_store.add(trigger);
    RLOG_INFO(QStringLiteral("ConsoleApp"),
              QStringLiteral("addTrigger"),
              QStringLiteral("alarm_added"),
              QStringLiteral("user_request"),
              QStringLiteral("store_append"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"alarm", m_store.get(id).value_or(trigger)}}));
    persist();
    return id;
}

TriggerListing ConsoleApp::listTriggers() const
{
    return m_store.list();
}

bool ConsoleApp::toggle(int index)
{
    const TriggerId id = m_store.resolveOrdinal(index);
    const bool enabled = m_store.toggleEnabled(index);
    RLOG_INFO(QStringLiteral("ConsoleApp"),
              QStringLiteral("toggle"),
              QStringLiteral("alarm_toggled"),
              QStringLiteral("user_request"),
              QStringLiteral("store_update"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"index", index}, {"id", id}, {"enabled", enabled}}));
    persist();
    return enabled;
}

Trigger ConsoleApp::remove(int index)
{
    Trigger removed = m_store.remove(index);
    const std::size_t cancelled = m_scheduler.cancelWatchesFor(removed.id);
    RLOG_INFO(QStringLiteral("ConsoleApp"),
              QStringLiteral("remove"),
              QStringLiteral("alarm_deleted"),
              QStringLiteral("user_request"),
              QStringLiteral("store_erase"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"alarm", removed}, {"cancelledWatches", cancelled}}));
    persist();
    return removed;
}

std::string ConsoleApp::readLine(const std::string &prompt)
{
    m_out.write(prompt);
    while (true) {
        std::string line;
        if (!std::getline(m_in, line)) {
            const InterruptKind interrupt = takePendingInterrupt();
            if (interrupt == InterruptKind::DuringAlarm) {
                m_in.clear();
                m_out.write(prompt);
                continue;
            }
            throw InputClosed(interrupt == InterruptKind::AtMenu);
        }

        if (routeAlarmResponse(line)) {
            m_out.write(prompt);
            continue;
        }
        return trim(line);
    }
}

bool ConsoleApp::routeAlarmResponse(const std::string &line)
{
    ResponseChannel &channel = m_coordinator.responseChannel();
    if (!channel.isOpen()) {
        return false;
    }

    const auto decision = parseDecision(line);
    if (!decision.has_value()) {
        m_out.writeLine("❌ Invalid choice. Please enter 1 or 2.");
        return true;
    }
    if (!channel.post(*decision)) {
        m_out.writeLine("The alarm was already handled.");
    }
    return true;
}

bool ConsoleApp::confirm(const std::string &question)
{
    const std::string answer = toLower(readLine(question));
    return answer == "y" || answer == "yes";
}

void ConsoleApp::displayMenu()
{
    std::ostringstream out;
    out << "\n" << kRule << "\n"
        << "           ALARM CLOCK MENU\n"
        << kRule << "\n"
        << "1. Set New Alarm\n"
        << "2. View All Alarms\n"
        << "3. Manage Alarms\n"
        << "4. Help\n"
        << "5. Exit\n"
        << kRule << "\n"
        << "Current Time: "
        << QTime::currentTime().toString(QStringLiteral("HH:mm:ss")).toStdString() << "\n"
        << "Active Alarms: " << m_store.enabledCount();
    m_out.writeLine(out.str());
}

void ConsoleApp::setAlarm()
{
    m_out.writeLine("\n" + kRule + "\n           SET NEW ALARM\n" + kRule);

    Trigger trigger;
    while (true) {
        const std::string input = readLine("Enter alarm time (HH:MM in 24-hour format): ");
        const auto time = parseTimeOfDay(input);
        if (time.has_value()) {
            trigger.fireTime = *time;
            break;
        }
        m_out.writeLine("❌ Invalid time format. Please use HH:MM (e.g., 14:30)");
    }

    trigger.toneRef = selectTone();
    trigger.deferDuration = std::chrono::minutes(selectSnoozeDuration());
    trigger.label = readLine("Enter alarm label (optional): ");

    const TriggerId id = addTrigger(trigger);
    const Trigger added = m_store.get(id).value_or(trigger);

    std::ostringstream out;
    out << "\n✅ Alarm set successfully!\n"
        << "   Time: " << formatTimeOfDay(added.fireTime) << "\n"
        << "   Tone: " << added.toneRef << "\n"
        << "   Snooze: " << added.deferDuration.count() << " minutes\n"
        << "   Label: " << added.label;
    m_out.writeLine(out.str());
}

std::string ConsoleApp::selectTone()
{
    std::ostringstream menu;
    menu << "\n\U0001F4FB Select Alarm Tone:\n";
    for (const auto &preset : m_tones.presets()) {
        menu << preset.choice << ". " << preset.displayName.toStdString() << "\n";
    }
    menu << "5. Use Custom Tone";
    m_out.writeLine(menu.str());

    while (true) {
        const auto choice = parseInt(readLine("Enter your choice (1-5): "));
        if (choice.has_value()) {
            if (const auto path = m_tones.presetPath(*choice)) {
                return *path;
            }
            if (*choice == 5) {
                return uploadCustomTone();
            }
        }
        m_out.writeLine("❌ Invalid choice. Please select 1-5.");
    }
}

std::string ConsoleApp::uploadCustomTone()
{
    while (true) {
        const std::string path =
            readLine("Enter path to custom audio file (.wav, .mp3, .ogg, .m4a): ");

        switch (m_tones.checkCustomTone(path)) {
        case CustomToneStatus::Ok:
            m_out.writeLine("✅ Custom tone selected: " + path);
            return path;
        case CustomToneStatus::UnsupportedExtension:
            m_out.writeLine("❌ Please select a valid audio file (.wav, .mp3, .ogg, .m4a)");
            break;
        case CustomToneStatus::NotFound:
            m_out.writeLine("❌ File not found. Please check the path.");
            if (confirm("Use default tone instead? (y/n): ")) {
                return m_tones.defaultTonePath();
            }
            break;
        }
    }
}

int ConsoleApp::selectSnoozeDuration()
{
    m_out.writeLine("\n⏰ Select Snooze Duration:\n"
                    "1. 5 minutes\n"
                    "2. 10 minutes\n"
                    "3. 15 minutes\n"
                    "4. Custom duration");

    while (true) {
        const std::string choice = readLine("Enter your choice (1-4): ");
        if (choice == "1") {
            return 5;
        }
        if (choice == "2") {
            return 10;
        }
        if (choice == "3") {
            return 15;
        }
        if (choice != "4") {
            m_out.writeLine("❌ Invalid choice. Please select 1-4.");
            continue;
        }

        while (true) {
            const auto minutes =
                parseInt(readLine("Enter custom snooze duration (1-60 minutes): "));
            if (!minutes.has_value()) {
                m_out.writeLine("❌ Please enter a valid number.");
            } else if (*minutes < 1 || *minutes > 60) {
                m_out.writeLine("❌ Please enter a value between 1 and 60 minutes.");
            } else {
                return *minutes;
            }
        }
    }
}

void ConsoleApp::viewAlarms()
{
    m_out.writeLine("\n" + kRule + "\n           YOUR ALARMS\n" + kRule);

    const TriggerListing listing = listTriggers();
    if (listing.empty()) {
        m_out.writeLine("No alarms set. Use option 1 to set an alarm.");
        return;
    }

    std::ostringstream out;
    for (const ListedTrigger row : listing) {
        const Trigger &alarm = row.trigger;
        out << row.ordinal << ". " << alarm.label << "\n"
            << "   Time: " << formatTimeOfDay(alarm.fireTime)
            << " | Status: " << (alarm.enabled ? "✅ ENABLED" : "❌ DISABLED");
        if (alarm.deferred) {
            out << " (Snoozed " << alarm.deferCount << "x)";
        }
        out << "\n"
            << "   Tone: " << toneBaseName(alarm.toneRef) << "\n"
            << "   Snooze: " << alarm.deferDuration.count() << " minutes\n"
            << std::string(40, '-') << "\n";
    }

    const auto pending = m_scheduler.pendingDeferrals();
    if (!pending.empty()) {
        out << "Snoozed alarms ringing again:\n";
        for (const auto &snoozed : pending) {
            out << "   " << formatTimeOfDay(snoozed.fireTime) << "  " << snoozed.label << "\n";
        }
    }
    m_out.write(out.str());
}

void ConsoleApp::manageAlarms()
{
    if (m_store.size() == 0) {
        m_out.writeLine("No alarms to manage. Set an alarm first.");
        return;
    }

    viewAlarms();
    m_out.writeLine("\nAlarm Management:\n"
                    "1. Enable/Disable Alarm\n"
                    "2. Delete Alarm\n"
                    "3. Back to Main Menu");

    const std::string choice = readLine("Enter your choice (1-3): ");
    if (choice == "1") {
        toggleAlarm();
    } else if (choice == "2") {
        deleteAlarm();
    } else if (choice != "3") {
        m_out.writeLine("❌ Invalid choice.");
    }
}

std::optional<int> ConsoleApp::readAlarmIndex(const std::string &prompt)
{
    const auto number = parseInt(readLine(prompt));
    if (!number.has_value()) {
        m_out.writeLine("❌ Please enter a valid number.");
        return std::nullopt;
    }
    // Anything below 1 maps to an index the store always rejects.
    return *number < 1 ? -1 : *number - 1;
}

void ConsoleApp::toggleAlarm()
{
    const auto index = readAlarmIndex("Enter alarm number to toggle: ");
    if (!index.has_value()) {
        return;
    }
    try {
        const bool enabled = toggle(*index);
        m_out.writeLine("✅ Alarm " + std::to_string(*index + 1)
                        + (enabled ? " enabled." : " disabled."));
    } catch (const OutOfRange &) {
        m_out.writeLine("❌ Invalid alarm number.");
    }
}

void ConsoleApp::deleteAlarm()
{
    const auto index = readAlarmIndex("Enter alarm number to delete: ");
    if (!index.has_value()) {
        return;
    }
    try {
        const Trigger removed = remove(*index);
        m_out.writeLine("✅ Alarm '" + removed.label + "' deleted.");
    } catch (const OutOfRange &) {
        m_out.writeLine("❌ Invalid alarm number.");
    }
}

void ConsoleApp::showHelp()
{
    m_out.writeLine(helpText());
}

void ConsoleApp::persist()
{
    if (!m_repository) {
        return;
    }
    try {
        m_repository->saveAll(m_store.snapshot());
    } catch (const StorageError &ex) {
        RLOG_WARN(QStringLiteral("ConsoleApp"),
                  QStringLiteral("persist"),
                  QStringLiteral("save_failed"),
                  QStringLiteral("sqlite_error"),
                  QStringLiteral("keep_in_memory"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"error", ex.what()}}));
        m_out.writeLine(std::string("⚠️ Could not save alarms: ") + ex.what());
    }
}

} // namespace reveille
