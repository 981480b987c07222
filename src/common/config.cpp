#include "common/config.hpp"

#include "common/logging.hpp"

#include <nlohmann/json.hpp>

namespace reveille {

namespace {

constexpr int kMaxSettingSeconds = 3600;

void applySecondsVariable(const char *name, std::chrono::seconds &target)
{
    const QString raw = qEnvironmentVariable(name);
    if (raw.isEmpty()) {
        return;
    }
    if (!parseSecondsSetting(raw, target)) {
        RLOG_WARN(QStringLiteral("Config"),
                  QStringLiteral("loadConfigFromEnvironment"),
                  QStringLiteral("invalid_setting_ignored"),
                  QStringLiteral("environment_override"),
                  QStringLiteral("keep_default"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"variable", name},
                                  {"value", raw.toStdString()},
                                  {"defaultSeconds", target.count()}}));
    }
}

} // namespace

QString defaultDataDir()
{
    const QString dataDir = qEnvironmentVariable("REVEILLE_DATA_DIR");
    if (!dataDir.isEmpty()) {
        return dataDir;
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/reveille");
    }
    return home + QStringLiteral("/.local/share/reveille");
}

bool parseSecondsSetting(const QString &value, std::chrono::seconds &out)
{
    bool ok = false;
    const int seconds = value.trimmed().toInt(&ok);
    if (!ok || seconds < 1 || seconds > kMaxSettingSeconds) {
        return false;
    }
    out = std::chrono::seconds(seconds);
    return true;
}

AppConfig loadConfigFromEnvironment()
{
    AppConfig config;
    config.dataDir = defaultDataDir();

    applySecondsVariable("REVEILLE_SCAN_INTERVAL_SEC", config.scanInterval);
    applySecondsVariable("REVEILLE_RESPONSE_TIMEOUT_SEC", config.responseTimeout);

    const QString toneDir = qEnvironmentVariable("REVEILLE_TONE_DIR");
    if (!toneDir.isEmpty()) {
        config.toneDir = toneDir;
    }

    config.playerCommand = qEnvironmentVariable("REVEILLE_PLAYER");
    config.traceEnabled = qEnvironmentVariableIntValue("REVEILLE_TRACE") == 1;
    return config;
}

} // namespace reveille
