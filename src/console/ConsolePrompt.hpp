#pragma once

#include <chrono>

#include "console/ConsoleOutput.hpp"
#include "scheduler/firing_coordinator.hpp"

namespace reveille {

// Renders firing episodes on the terminal. Answers come back through the
// console's input loop, see ConsoleApp::readLine().
class ConsolePrompt : public FiringPrompt
{
public:
    ConsolePrompt(ConsoleWriter &writer, std::chrono::seconds responseTimeout);

    void presentFiring(const Trigger &trigger) override;
    void reportOutcome(const FiringResult &result) override;

private:
    ConsoleWriter &m_writer;
    std::chrono::seconds m_responseTimeout;
};

} // namespace reveille
