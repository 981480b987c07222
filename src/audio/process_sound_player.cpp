#include "audio/process_sound_player.hpp"

#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>

#include <vector>

#include "audio/tone_library.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

namespace reveille {

namespace {

struct PlayerCandidate {
    QString program;
    QStringList args;
};

const std::vector<PlayerCandidate> &knownPlayers()
{
    static const std::vector<PlayerCandidate> players = {
        {QStringLiteral("paplay"), {}},
        {QStringLiteral("aplay"), {QStringLiteral("-q")}},
        {QStringLiteral("ffplay"),
         {QStringLiteral("-nodisp"), QStringLiteral("-autoexit"),
          QStringLiteral("-loglevel"), QStringLiteral("quiet")}},
        {QStringLiteral("mpg123"), {QStringLiteral("-q")}},
    };
    return players;
}

} // namespace

ProcessSoundPlayer::ProcessSoundPlayer(const QString &command)
{
    if (!command.trimmed().isEmpty()) {
        QStringList parts = command.split(QLatin1Char(' '), Qt::SkipEmptyParts);
        const QString program = parts.takeFirst();
        const QFileInfo info(program);
        m_program = info.isAbsolute()
            ? (info.isExecutable() ? program : QString())
            : QStandardPaths::findExecutable(program);
        m_baseArgs = parts;
        if (m_program.isEmpty()) {
            RLOG_WARN(QStringLiteral("ProcessSoundPlayer"),
                      QStringLiteral("ProcessSoundPlayer"),
                      QStringLiteral("player_not_found"),
                      QStringLiteral("configured_command"),
                      QStringLiteral("fallback_cue"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"command", command.toStdString()}}));
        }
        return;
    }

    for (const auto &candidate : knownPlayers()) {
        const QString path = QStandardPaths::findExecutable(candidate.program);
        if (!path.isEmpty()) {
            m_program = path;
            m_baseArgs = candidate.args;
            return;
        }
    }
}

bool ProcessSoundPlayer::play(const std::string &resourceRef)
{
    const QString path = QString::fromStdString(resourceRef);
    if (!isAvailable() || !QFileInfo::exists(path) || ToneLibrary::isPlaceholder(path)) {
        return false;
    }

    QStringList args = m_baseArgs;
    args << path;
    if (!QProcess::startDetached(m_program, args)) {
        throw PlaybackError("failed to launch " + m_program.toStdString());
    }

    RLOG_DEBUG(QStringLiteral("ProcessSoundPlayer"),
               QStringLiteral("play"),
               QStringLiteral("tone_started"),
               QStringLiteral("alarm_firing"),
               QStringLiteral("qprocess_detached"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"program", m_program.toStdString()},
                               {"tone", resourceRef}}));
    return true;
}

bool ProcessSoundPlayer::isAvailable() const
{
    return !m_program.isEmpty();
}

QString ProcessSoundPlayer::program() const
{
    return m_program;
}

} // namespace reveille
