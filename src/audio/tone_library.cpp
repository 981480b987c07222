#include "audio/tone_library.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStringList>

#include <utility>

#include "common/errors.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

namespace reveille {

namespace {

const QByteArray kPlaceholderPrefix = QByteArrayLiteral("Placeholder for ");

const std::vector<TonePreset> &builtinPresets()
{
    static const std::vector<TonePreset> presets = {
        {1, QStringLiteral("Default Beep"), QStringLiteral("beep.wav")},
        {2, QStringLiteral("Bell Sound"), QStringLiteral("bell.wav")},
        {3, QStringLiteral("Chime"), QStringLiteral("chime.wav")},
        {4, QStringLiteral("Buzzer"), QStringLiteral("buzzer.wav")},
    };
    return presets;
}

const QStringList &allowedExtensions()
{
    static const QStringList extensions = {
        QStringLiteral("wav"),
        QStringLiteral("mp3"),
        QStringLiteral("ogg"),
        QStringLiteral("m4a"),
    };
    return extensions;
}

} // namespace

ToneLibrary::ToneLibrary(QString toneDir)
    : m_toneDir(std::move(toneDir))
{
}

void ToneLibrary::ensureDefaults() const
{
    QDir dir(m_toneDir);
    if (!dir.exists() && !QDir().mkpath(m_toneDir)) {
        throw ResourceError("cannot create tone directory " + m_toneDir.toStdString());
    }

    for (const auto &preset : builtinPresets()) {
        const QString path = dir.filePath(preset.fileName);
        if (QFileInfo::exists(path)) {
            continue;
        }
        QFile file(path);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            RLOG_WARN(QStringLiteral("ToneLibrary"),
                      QStringLiteral("ensureDefaults"),
                      QStringLiteral("placeholder_write_failed"),
                      QStringLiteral("missing_preset_tone"),
                      QStringLiteral("qfile"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"path", path.toStdString()}}));
            continue;
        }
        file.write(kPlaceholderPrefix + preset.fileName.toUtf8());
    }
}

const std::vector<TonePreset> &ToneLibrary::presets() const
{
    return builtinPresets();
}

std::optional<std::string> ToneLibrary::presetPath(int choice) const
{
    for (const auto &preset : builtinPresets()) {
        if (preset.choice == choice) {
            return QDir(m_toneDir).filePath(preset.fileName).toStdString();
        }
    }
    return std::nullopt;
}

std::string ToneLibrary::defaultTonePath() const
{
    return QDir(m_toneDir).filePath(builtinPresets().front().fileName).toStdString();
}

CustomToneStatus ToneLibrary::checkCustomTone(const std::string &path) const
{
    const QFileInfo info(QString::fromStdString(path));
    if (path.empty() || !info.exists() || !info.isFile()) {
        return CustomToneStatus::NotFound;
    }
    if (!allowedExtensions().contains(info.suffix().toLower())) {
        return CustomToneStatus::UnsupportedExtension;
    }
    return CustomToneStatus::Ok;
}

QString ToneLibrary::toneDir() const
{
    return m_toneDir;
}

bool ToneLibrary::isPlaceholder(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return false;
    }
    return file.read(kPlaceholderPrefix.size()) == kPlaceholderPrefix;
}

} // namespace reveille
