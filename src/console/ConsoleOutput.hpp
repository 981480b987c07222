#pragma once

#include <mutex>
#include <ostream>
#include <string>

#include "audio/sound_player.hpp"

namespace reveille {

// Serializes writes to the terminal; the console thread and the firing
// threads share it.
class ConsoleWriter
{
public:
    explicit ConsoleWriter(std::ostream &out);

    void write(const std::string &text);
    void writeLine(const std::string &text);

private:
    std::ostream &m_out;
    std::mutex m_mutex;
};

// Text stand-in for a tone when no audio player or real tone file exists.
class ConsoleCue : public SoundPlayer
{
public:
    explicit ConsoleCue(ConsoleWriter &writer, int beeps = 5);

    bool play(const std::string &resourceRef) override;

private:
    ConsoleWriter &m_writer;
    int m_beeps;
};

} // namespace reveille
