#pragma once

#include <chrono>

#include <QString>

namespace reveille {

struct AppConfig {
    std::chrono::seconds scanInterval{30};
    std::chrono::seconds responseTimeout{30};
    QString toneDir = QStringLiteral("alarm_tones");
    QString dataDir;
    // Empty means: probe PATH for a known audio player.
    QString playerCommand;
    bool persist = true;
    bool traceEnabled = false;
};

// $REVEILLE_DATA_DIR, else $HOME/.local/share/reveille.
QString defaultDataDir();

// Reads the REVEILLE_* environment variables. Unset or invalid values keep
// their defaults; invalid ones are logged.
AppConfig loadConfigFromEnvironment();

// Parses a positive number of seconds. Returns false (and leaves out untouched)
// for anything that is not an integer in [1, 3600].
bool parseSecondsSetting(const QString &value, std::chrono::seconds &out);

} // namespace reveille
