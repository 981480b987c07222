#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "common/models.hpp"
#include "scheduler/firing_coordinator.hpp"
#include "scheduler/trigger_store.hpp"

namespace reveille {

/**
 * SchedulerLoop drives the alarm clock:
 * - a main scan that, every interval, fires the first due trigger of the store
 * - one supervised watch task per snoozed follow-up trigger
 *
 * scanOnce() and checkWatches() run a single pass on the calling thread; start()
 * runs the same passes on background threads until stop().
 */
class SchedulerLoop
{
public:
    using Clock = FiringCoordinator::Clock;

    SchedulerLoop(TriggerStore &store,
                  FiringCoordinator &coordinator,
                  std::chrono::milliseconds interval,
                  Clock clock = [] { return std::chrono::system_clock::now(); });
    ~SchedulerLoop();

    SchedulerLoop(const SchedulerLoop &) = delete;
    SchedulerLoop &operator=(const SchedulerLoop &) = delete;

    void start();
    // Ends the main scan and every watch thread and joins them. An alarm
    // still waiting for an answer is interrupted. Snoozes that have not rung
    // yet are kept and watched again after the next start().
    void stop();
    bool isRunning() const;

    // Fires at most one due store trigger. Returns the episode's result, or
    // std::nullopt when nothing was due or the firing slot was taken.
    std::optional<FiringResult> scanOnce(std::chrono::system_clock::time_point now);

    // Polls every pending follow-up once. Returns the episodes that ran.
    std::vector<FiringResult> checkWatches(std::chrono::system_clock::time_point now);

    // Starts watching a follow-up trigger. Ignored when the store member it
    // derives from no longer exists.
    void watch(const Trigger &followUp);

    // Cancels every watch derived from the given store trigger.
    std::size_t cancelWatchesFor(TriggerId originId);

    std::vector<Trigger> pendingDeferrals() const;

    // Watch threads started and not yet joined.
    std::size_t liveWatchThreads() const;

private:
    struct WatchTask {
        std::uint64_t id = 0;
        Trigger trigger;
        bool cancelled = false;
        bool inFlight = false;
        bool resolved = false;
        bool exited = false;
        std::thread thread;
    };

    void runMainScan();
    void runWatch(const std::shared_ptr<WatchTask> &task);
    std::optional<FiringResult> pollWatch(const std::shared_ptr<WatchTask> &task,
                                          std::chrono::system_clock::time_point now);
    void spawnWatchThread(const std::shared_ptr<WatchTask> &task);
    bool waitForNextTick(const std::shared_ptr<WatchTask> &task);
    void retireWatch(const std::shared_ptr<WatchTask> &task);
    void reapRetiredWatches();

    TriggerStore &m_store;
    FiringCoordinator &m_coordinator;
    std::chrono::milliseconds m_interval;
    Clock m_clock;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_running = false;
    std::thread m_scanThread;

    std::map<std::uint64_t, std::shared_ptr<WatchTask>> m_watches;
    std::vector<std::shared_ptr<WatchTask>> m_retired;
    std::uint64_t m_nextWatchId = 1;

    // Minute stamp of each store trigger's last firing; a trigger fires at
    // most once per minute even though the scan runs more often.
    std::map<TriggerId, std::int64_t> m_lastFiredMinute;
};

} // namespace reveille
