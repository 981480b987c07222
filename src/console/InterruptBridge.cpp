#include "console/InterruptBridge.hpp"

#include <csignal>
#include <cstdio>

#include <signal.h>

namespace reveille {

namespace {

ResponseChannel *g_channel = nullptr;
volatile std::sig_atomic_t g_pending = 0;

void onInterrupt(int)
{
    bool alarmWaiting = false;
    if (g_channel) {
        alarmWaiting = g_channel->requestInterrupt();
    }
    g_pending = alarmWaiting ? 1 : 2;
}

} // namespace

void installInterruptHandler(ResponseChannel &channel)
{
    g_channel = &channel;

    struct sigaction action {};
    action.sa_handler = &onInterrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
}

InterruptKind takePendingInterrupt()
{
    const std::sig_atomic_t pending = g_pending;
    g_pending = 0;
    if (pending == 0) {
        return InterruptKind::None;
    }
    std::clearerr(stdin);
    return pending == 1 ? InterruptKind::DuringAlarm : InterruptKind::AtMenu;
}

} // namespace reveille
