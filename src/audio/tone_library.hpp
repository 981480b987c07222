#pragma once

#include <optional>
#include <string>
#include <vector>

#include <QString>

namespace reveille {

struct TonePreset {
    int choice = 0;
    QString displayName;
    QString fileName;
};

enum class CustomToneStatus {
    Ok,
    NotFound,
    UnsupportedExtension
};

// ToneLibrary resolves the four built-in tones to files under the tone
// directory and validates user-supplied tone files.
class ToneLibrary
{
public:
    explicit ToneLibrary(QString toneDir);

    // Creates the tone directory and writes a text placeholder for every preset
    // file that does not exist. Throws ResourceError if the directory cannot be
    // created.
    void ensureDefaults() const;

    const std::vector<TonePreset> &presets() const;

    // Path for preset 1-4, std::nullopt for anything else.
    std::optional<std::string> presetPath(int choice) const;
    std::string defaultTonePath() const;

    CustomToneStatus checkCustomTone(const std::string &path) const;

    QString toneDir() const;

    // True for the text files ensureDefaults() writes in place of real audio.
    static bool isPlaceholder(const QString &path);

private:
    QString m_toneDir;
};

} // namespace reveille
