#pragma once

#include <string>

#include <QString>
#include <QStringList>

#include "audio/sound_player.hpp"

namespace reveille {

// Plays tones by launching an external audio command (paplay, aplay, ffplay
// or mpg123) detached from the scheduler threads.
class ProcessSoundPlayer : public SoundPlayer
{
public:
    // Empty command: probe PATH. Otherwise the command is split on spaces and
    // the tone path appended as the last argument.
    explicit ProcessSoundPlayer(const QString &command = QString());

    bool play(const std::string &resourceRef) override;

    bool isAvailable() const;
    QString program() const;

private:
    QString m_program;
    QStringList m_baseArgs;
};

} // namespace reveille
