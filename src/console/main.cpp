#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>

#include <csignal>
#include <iostream>
#include <memory>

#include <pthread.h>

#include <nlohmann/json.hpp>

#include "audio/process_sound_player.hpp"
#include "audio/tone_library.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/reveille_version.hpp"
#include "console/ConsoleApp.hpp"
#include "console/ConsoleOutput.hpp"
#include "console/ConsolePrompt.hpp"
#include "console/InterruptBridge.hpp"
#include "scheduler/firing_coordinator.hpp"
#include "scheduler/scheduler_loop.hpp"
#include "scheduler/trigger_repository.hpp"
#include "scheduler/trigger_store.hpp"

namespace {

void applySecondsOption(const QCommandLineParser &parser,
                        const QCommandLineOption &option,
                        std::chrono::seconds &target)
{
    if (!parser.isSet(option)) {
        return;
    }
    const QString value = parser.value(option);
    if (!reveille::parseSecondsSetting(value, target)) {
        std::cerr << "Ignoring invalid value for --" << option.names().constFirst().toStdString()
                  << ": " << value.toStdString() << "\n";
    }
}

// Worker threads inherit the signal mask, so SIGINT is always delivered to the
// console thread whose blocking read it has to interrupt.
void startWithSigintBlocked(reveille::SchedulerLoop &scheduler)
{
    sigset_t sigint;
    sigemptyset(&sigint);
    sigaddset(&sigint, SIGINT);
    sigset_t previous;
    pthread_sigmask(SIG_BLOCK, &sigint, &previous);
    scheduler.start();
    pthread_sigmask(SIG_SETMASK, &previous, nullptr);
}

int listSavedAlarms(const reveille::AppConfig &config)
{
    try {
        reveille::TriggerRepository repository(
            reveille::TriggerRepository::defaultDbPath(config.dataDir));
        const nlohmann::json alarms = repository.loadAll();
        std::cout << alarms.dump(2) << std::endl;
        return 0;
    } catch (const reveille::StorageError &ex) {
        std::cerr << "Could not read saved alarms: " << ex.what() << std::endl;
        return 1;
    }
}

// Everything from tone setup to the final save. Returns the exit code.
int runAlarmClock(const reveille::AppConfig &config)
{
    reveille::ToneLibrary tones(config.toneDir);
    try {
        tones.ensureDefaults();
    } catch (const reveille::ResourceError &ex) {
        RLOG_ERROR(QStringLiteral("main"),
                   QStringLiteral("runAlarmClock"),
                   QStringLiteral("tone_dir_unavailable"),
                   QStringLiteral("init_failure"),
                   QStringLiteral("exit"),
                   reveille::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"error", ex.what()}}));
        std::cerr << "❌ " << ex.what() << std::endl;
        return 1;
    }

    reveille::TriggerStore store;
    std::unique_ptr<reveille::TriggerRepository> repository;
    if (config.persist) {
        try {
            QDir().mkpath(config.dataDir);
            repository = std::make_unique<reveille::TriggerRepository>(
                reveille::TriggerRepository::defaultDbPath(config.dataDir));
            for (const auto &saved : repository->loadAll()) {
                store.add(saved);
            }
        } catch (const reveille::StorageError &ex) {
            RLOG_WARN(QStringLiteral("main"),
                      QStringLiteral("runAlarmClock"),
                      QStringLiteral("alarm_db_unavailable"),
                      QStringLiteral("sqlite_error"),
                      QStringLiteral("run_without_persistence"),
                      reveille::logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"error", ex.what()}}));
            std::cerr << "⚠️ Alarms will not be saved: " << ex.what() << std::endl;
            repository.reset();
        }
    }

    reveille::ConsoleWriter writer(std::cout);
    reveille::ProcessSoundPlayer player(config.playerCommand);
    reveille::ConsoleCue cue(writer);
    reveille::ConsolePrompt prompt(writer, config.responseTimeout);
    reveille::FiringCoordinator coordinator(store, player, cue, prompt, config.responseTimeout);
    reveille::SchedulerLoop scheduler(
        store,
        coordinator,
        std::chrono::duration_cast<std::chrono::milliseconds>(config.scanInterval));

    if (player.isAvailable()) {
        RLOG_INFO(QStringLiteral("main"),
                  QStringLiteral("runAlarmClock"),
                  QStringLiteral("audio_player_selected"),
                  QStringLiteral("startup"),
                  QStringLiteral("path_probe"),
                  reveille::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"program", player.program().toStdString()}}));
    } else {
        writer.writeLine("No audio player found; alarms will beep on screen.");
    }

    reveille::installInterruptHandler(coordinator.responseChannel());
    startWithSigintBlocked(scheduler);

    reveille::ConsoleApp console(std::cin, writer, store, scheduler, coordinator, tones,
                                 repository.get());
    const int exitCode = console.run();

    scheduler.stop();
    if (repository) {
        try {
            repository->saveAll(store.snapshot());
        } catch (const reveille::StorageError &ex) {
            RLOG_WARN(QStringLiteral("main"),
                      QStringLiteral("runAlarmClock"),
                      QStringLiteral("final_save_failed"),
                      QStringLiteral("sqlite_error"),
                      QStringLiteral("exit_anyway"),
                      reveille::logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"error", ex.what()}}));
        }
    }

    RLOG_INFO(QStringLiteral("main"),
              QStringLiteral("runAlarmClock"),
              QStringLiteral("alarms_saved"),
              QStringLiteral("user_exit"),
              QStringLiteral("console"),
              reveille::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"alarms", store.size()}, {"persist", repository != nullptr}}));
    return exitCode;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("reveille"));
    QCoreApplication::setApplicationVersion(QStringLiteral(REVEILLE_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Console alarm clock"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption traceOption(QStringLiteral("trace"),
                                         QStringLiteral("Write debug events and a trace log."));
    const QCommandLineOption scanOption(QStringLiteral("scan-interval"),
                                        QStringLiteral("Seconds between alarm scans."),
                                        QStringLiteral("seconds"));
    const QCommandLineOption timeoutOption(QStringLiteral("response-timeout"),
                                           QStringLiteral("Seconds before a ringing alarm snoozes itself."),
                                           QStringLiteral("seconds"));
    const QCommandLineOption toneDirOption(QStringLiteral("tone-dir"),
                                           QStringLiteral("Directory holding the default tones."),
                                           QStringLiteral("dir"));
    const QCommandLineOption noPersistOption(QStringLiteral("no-persist"),
                                             QStringLiteral("Do not load or save alarms."));
    const QCommandLineOption listOption(QStringLiteral("list"),
                                        QStringLiteral("Print the saved alarms as JSON and exit."));
    parser.addOption(traceOption);
    parser.addOption(scanOption);
    parser.addOption(timeoutOption);
    parser.addOption(toneDirOption);
    parser.addOption(noPersistOption);
    parser.addOption(listOption);
    parser.process(app);

    reveille::AppConfig config = reveille::loadConfigFromEnvironment();
    if (parser.isSet(traceOption)) {
        config.traceEnabled = true;
    }
    applySecondsOption(parser, scanOption, config.scanInterval);
    applySecondsOption(parser, timeoutOption, config.responseTimeout);
    if (parser.isSet(toneDirOption)) {
        config.toneDir = parser.value(toneDirOption);
    }
    if (parser.isSet(noPersistOption)) {
        config.persist = false;
    }

    reveille::logging::initLogging(QStringLiteral("reveille"),
                                   config.traceEnabled,
                                   config.dataDir + QStringLiteral("/logs"));
    reveille::logging::setThreadRole(QStringLiteral("console"));
    RLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("reveille_start"),
              QStringLiteral("user_start"),
              QStringLiteral("console"),
              reveille::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"version", REVEILLE_VERSION},
                              {"scanIntervalSec", config.scanInterval.count()},
                              {"responseTimeoutSec", config.responseTimeout.count()},
                              {"toneDir", config.toneDir.toStdString()},
                              {"persist", config.persist}}));

    if (parser.isSet(listOption)) {
        return listSavedAlarms(config);
    }

    const int exitCode = reveille::runReportingFailure(
        [&config] { return runAlarmClock(config); }, std::cerr);

    RLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("reveille_stop"),
              QStringLiteral("user_exit"),
              QStringLiteral("console"),
              reveille::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"exitCode", exitCode}}));
    return exitCode;
}
