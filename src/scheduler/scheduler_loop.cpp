#include "scheduler/scheduler_loop.hpp"

#include <exception>
#include <utility>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/time_of_day.hpp"

#include <nlohmann/json.hpp>

namespace reveille {

SchedulerLoop::SchedulerLoop(TriggerStore &store,
                             FiringCoordinator &coordinator,
                             std::chrono::milliseconds interval,
                             Clock clock)
    : m_store(store)
    , m_coordinator(coordinator)
    , m_interval(interval)
    , m_clock(std::move(clock))
{
}

SchedulerLoop::~SchedulerLoop()
{
    stop();
}

void SchedulerLoop::start()
{
    std::vector<std::shared_ptr<WatchTask>> pending;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_running) {
            return;
        }
        m_running = true;
        for (const auto &entry : m_watches) {
            if (!entry.second->thread.joinable()) {
                pending.push_back(entry.second);
            }
        }
    }

    RLOG_INFO(QStringLiteral("SchedulerLoop"),
              QStringLiteral("start"),
              QStringLiteral("monitoring_started"),
              QStringLiteral("user_start"),
              QStringLiteral("scan_thread"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"intervalMs", m_interval.count()},
                              {"pendingWatches", pending.size()}}));

    m_coordinator.resume();
    m_scanThread = std::thread([this] { runMainScan(); });
    for (const auto &task : pending) {
        spawnWatchThread(task);
    }
}

void SchedulerLoop::stop()
{
    std::vector<std::shared_ptr<WatchTask>> tasks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running && !m_scanThread.joinable() && m_retired.empty()) {
            return;
        }
        m_running = false;
        for (const auto &entry : m_watches) {
            tasks.push_back(entry.second);
        }
        for (auto &task : m_retired) {
            tasks.push_back(task);
        }
        m_retired.clear();
    }
    m_cv.notify_all();
    m_coordinator.shutdown();

    if (m_scanThread.joinable()) {
        m_scanThread.join();
    }
    for (auto &task : tasks) {
        if (task->thread.joinable()) {
            task->thread.join();
        }
    }

    // Unresolved follow-ups stay registered so the next start() watches them
    // again; their store members are still marked deferred.
    std::size_t kept = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_watches.begin(); it != m_watches.end();) {
            const auto &task = it->second;
            if (task->resolved || task->cancelled) {
                it = m_watches.erase(it);
                continue;
            }
            task->exited = false;
            ++kept;
            ++it;
        }
    }

    RLOG_INFO(QStringLiteral("SchedulerLoop"),
              QStringLiteral("stop"),
              QStringLiteral("monitoring_stopped"),
              QStringLiteral("shutdown"),
              QStringLiteral("join_tasks"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"watchTasks", tasks.size()}, {"keptWatches", kept}}));
}

bool SchedulerLoop::isRunning() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running;
}

std::optional<FiringResult> SchedulerLoop::scanOnce(std::chrono::system_clock::time_point now)
{
    const TimeOfDay current = timeOfDayAt(now);
    const std::int64_t stamp = minuteStamp(now);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_lastFiredMinute.begin(); it != m_lastFiredMinute.end();) {
            if (it->second < stamp) {
                it = m_lastFiredMinute.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto &trigger : m_store.dueCandidates()) {
        if (trigger.fireTime != current) {
            continue;
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            const auto fired = m_lastFiredMinute.find(trigger.id);
            if (fired != m_lastFiredMinute.end() && fired->second == stamp) {
                continue;
            }
        }

        // Store order decides who goes first; whoever is behind a busy slot
        // is picked up by a later scan.
        if (!m_coordinator.isIdle()) {
            return std::nullopt;
        }

        FiringResult result;
        try {
            result = m_coordinator.fire(trigger);
        } catch (const std::exception &ex) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_lastFiredMinute[trigger.id] = stamp;
            RLOG_ERROR(QStringLiteral("SchedulerLoop"),
                       QStringLiteral("scanOnce"),
                       QStringLiteral("firing_failed"),
                       QStringLiteral("exception"),
                       QStringLiteral("skip_until_next_minute"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"triggerId", trigger.id}, {"error", ex.what()}}));
            return std::nullopt;
        }

        if (result.outcome == FiringOutcome::Busy) {
            return std::nullopt;
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_lastFiredMinute[trigger.id] = stamp;
        }
        if (result.followUp.has_value()) {
            watch(*result.followUp);
        }
        return result;
    }
    return std::nullopt;
}

std::vector<FiringResult> SchedulerLoop::checkWatches(std::chrono::system_clock::time_point now)
{
    std::vector<std::shared_ptr<WatchTask>> tasks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &entry : m_watches) {
            tasks.push_back(entry.second);
        }
    }

    std::vector<FiringResult> results;
    for (const auto &task : tasks) {
        auto result = pollWatch(task, now);
        if (!result.has_value()) {
            continue;
        }
        results.push_back(*result);
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!task->thread.joinable()) {
            m_watches.erase(task->id);
        }
    }
    return results;
}

void SchedulerLoop::watch(const Trigger &followUp)
{
    if (!m_store.get(followUp.originId).has_value()) {
        RLOG_WARN(QStringLiteral("SchedulerLoop"),
                  QStringLiteral("watch"),
                  QStringLiteral("follow_up_dropped"),
                  QStringLiteral("origin_deleted"),
                  QStringLiteral("skip_watch"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"followUp", followUp}}));
        return;
    }

    auto task = std::make_shared<WatchTask>();
    task->trigger = followUp;

    bool running = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        task->id = m_nextWatchId++;
        m_watches.emplace(task->id, task);
        running = m_running;
    }

    RLOG_INFO(QStringLiteral("SchedulerLoop"),
              QStringLiteral("watch"),
              QStringLiteral("snooze_watch_started"),
              QStringLiteral("alarm_snoozed"),
              running ? QStringLiteral("watch_thread") : QStringLiteral("manual_poll"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"watchId", task->id}, {"followUp", followUp}}));

    reapRetiredWatches();
    if (running) {
        spawnWatchThread(task);
    }
}

std::size_t SchedulerLoop::cancelWatchesFor(TriggerId originId)
{
    std::size_t cancelled = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_watches.begin(); it != m_watches.end();) {
            const auto &task = it->second;
            if (task->trigger.originId != originId) {
                ++it;
                continue;
            }
            task->cancelled = true;
            ++cancelled;
            // While stopped, stop() owns the join.
            if (m_running && task->thread.joinable()) {
                m_retired.push_back(task);
            }
            it = m_watches.erase(it);
        }
    }
    m_cv.notify_all();
    return cancelled;
}

std::vector<Trigger> SchedulerLoop::pendingDeferrals() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Trigger> pending;
    for (const auto &entry : m_watches) {
        if (!entry.second->resolved && !entry.second->cancelled) {
            pending.push_back(entry.second->trigger);
        }
    }
    return pending;
}

std::size_t SchedulerLoop::liveWatchThreads() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::size_t live = 0;
    for (const auto &entry : m_watches) {
        if (entry.second->thread.joinable()) {
            ++live;
        }
    }
    for (const auto &task : m_retired) {
        if (task->thread.joinable()) {
            ++live;
        }
    }
    return live;
}

void SchedulerLoop::runMainScan()
{
    logging::setThreadRole(QStringLiteral("scan"));
    while (true) {
        bool fired = false;
        try {
            fired = scanOnce(m_clock()).has_value();
        } catch (const std::exception &ex) {
            RLOG_ERROR(QStringLiteral("SchedulerLoop"),
                       QStringLiteral("runMainScan"),
                       QStringLiteral("scan_failed"),
                       QStringLiteral("exception"),
                       QStringLiteral("retry_next_interval"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"error", ex.what()}}));
        }
        reapRetiredWatches();

        if (fired) {
            // Rescan at once so a trigger queued behind the slot can still
            // fire within its minute.
            if (!isRunning()) {
                break;
            }
            continue;
        }
        if (!waitForNextTick(nullptr)) {
            break;
        }
    }
}

void SchedulerLoop::runWatch(const std::shared_ptr<WatchTask> &task)
{
    logging::setThreadRole(QStringLiteral("watch-%1").arg(task->id));
    while (true) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_running || task->cancelled || task->resolved) {
                break;
            }
        }

        std::optional<FiringResult> result;
        try {
            result = pollWatch(task, m_clock());
        } catch (const std::exception &ex) {
            RLOG_ERROR(QStringLiteral("SchedulerLoop"),
                       QStringLiteral("runWatch"),
                       QStringLiteral("watch_poll_failed"),
                       QStringLiteral("exception"),
                       QStringLiteral("end_watch"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"watchId", task->id}, {"error", ex.what()}}));
            break;
        }
        if (result.has_value()) {
            break;
        }
        if (!waitForNextTick(task)) {
            break;
        }
    }
    retireWatch(task);
}

std::optional<FiringResult> SchedulerLoop::pollWatch(const std::shared_ptr<WatchTask> &task,
                                                     std::chrono::system_clock::time_point now)
{
    Trigger trigger;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (task->cancelled || task->resolved || task->inFlight) {
            return std::nullopt;
        }
        trigger = task->trigger;
        if (trigger.fireTime != timeOfDayAt(now) || !m_coordinator.isIdle()) {
            return std::nullopt;
        }
        task->inFlight = true;
    }

    FiringResult result;
    try {
        result = m_coordinator.fire(trigger);
    } catch (const std::exception &) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            task->inFlight = false;
            task->resolved = true;
            if (!task->thread.joinable()) {
                m_watches.erase(task->id);
            }
        }
        // The follow-up is gone, so the main scan takes the alarm back.
        m_store.resetDeferral(task->trigger.originId);
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        task->inFlight = false;
        if (result.outcome == FiringOutcome::Busy) {
            return std::nullopt;
        }
        task->resolved = true;
    }

    if (result.followUp.has_value()) {
        watch(*result.followUp);
    }
    return result;
}

void SchedulerLoop::spawnWatchThread(const std::shared_ptr<WatchTask> &task)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_running || task->cancelled || task->thread.joinable()) {
        return;
    }
    task->thread = std::thread([this, task] { runWatch(task); });
}

bool SchedulerLoop::waitForNextTick(const std::shared_ptr<WatchTask> &task)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    const bool stopped = m_cv.wait_for(lock, m_interval, [this, &task] {
        return !m_running || (task && task->cancelled);
    });
    return !stopped;
}

void SchedulerLoop::retireWatch(const std::shared_ptr<WatchTask> &task)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    task->exited = true;
    if (!m_running) {
        // stop() joins this thread and decides whether the watch is kept.
        return;
    }
    const auto it = m_watches.find(task->id);
    if (it == m_watches.end()) {
        // Already moved to m_retired by cancelWatchesFor().
        return;
    }
    m_retired.push_back(it->second);
    m_watches.erase(it);
}

void SchedulerLoop::reapRetiredWatches()
{
    std::vector<std::shared_ptr<WatchTask>> finished;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_retired.begin(); it != m_retired.end();) {
            const auto &task = *it;
            if (!task->exited || task->thread.get_id() == std::this_thread::get_id()) {
                ++it;
                continue;
            }
            finished.push_back(task);
            it = m_retired.erase(it);
        }
    }
    // These threads have passed retireWatch() and are returning; join outside
    // the lock.
    for (auto &task : finished) {
        if (task->thread.joinable()) {
            task->thread.join();
        }
    }
}

} // namespace reveille
