#include "console/ConsoleOutput.hpp"

namespace reveille {

ConsoleWriter::ConsoleWriter(std::ostream &out)
    : m_out(out)
{
}

void ConsoleWriter::write(const std::string &text)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_out << text << std::flush;
}

void ConsoleWriter::writeLine(const std::string &text)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_out << text << "\n" << std::flush;
}

ConsoleCue::ConsoleCue(ConsoleWriter &writer, int beeps)
    : m_writer(writer)
    , m_beeps(beeps)
{
}

bool ConsoleCue::play(const std::string &)
{
    std::string text;
    for (int i = 0; i < m_beeps; ++i) {
        text += "♪ BEEP BEEP BEEP ♪\n";
    }
    m_writer.write(text);
    return true;
}

} // namespace reveille
