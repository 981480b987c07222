#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <stdexcept>
#include <vector>

#include "common/time_of_day.hpp"
#include "scheduler/firing_coordinator.hpp"
#include "scheduler/scheduler_loop.hpp"

using namespace std::chrono_literals;

namespace {

class SilentPlayer : public reveille::SoundPlayer
{
public:
    bool play(const std::string &) override
    {
        return true;
    }
};

class ScriptedPrompt : public reveille::FiringPrompt
{
public:
    void presentFiring(const reveille::Trigger &trigger) override
    {
        ++presentedCount;
        if (onPresent) {
            onPresent(trigger);
        }
    }

    void reportOutcome(const reveille::FiringResult &) override
    {
        ++reportedCount;
    }

    std::function<void(const reveille::Trigger &)> onPresent;
    std::atomic<int> presentedCount{0};
    std::atomic<int> reportedCount{0};
};

// Store, coordinator and loop sharing one adjustable clock.
struct Fixture {
    explicit Fixture(std::chrono::steady_clock::duration responseTimeout = 5s,
                     std::chrono::milliseconds interval = 1000ms)
        : coordinator(store, player, cue, prompt, responseTimeout, [this] { return now.load(); })
        , loop(store, coordinator, interval, [this] { return now.load(); })
    {
    }

    void answer(reveille::FiringDecision decision)
    {
        prompt.onPresent = [this, decision](const reveille::Trigger &) {
            coordinator.responseChannel().post(decision);
        };
    }

    reveille::TriggerId addAlarm(int hour, int minute, const std::string &label = {})
    {
        reveille::Trigger trigger;
        trigger.fireTime = {hour, minute};
        trigger.label = label;
        return store.add(trigger);
    }

    // Read by the scan and watch threads.
    std::atomic<std::chrono::system_clock::time_point> now{reveille::localTimeToday(9, 0)};
    reveille::TriggerStore store;
    SilentPlayer player;
    SilentPlayer cue;
    ScriptedPrompt prompt;
    reveille::FiringCoordinator coordinator;
    reveille::SchedulerLoop loop;
};

} // namespace

class SchedulerLoopTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testNothingDue();
    void testDisabledAlarmDoesNotFire();
    void testFiresOncePerMinute();
    void testSameMinuteAlarmsFireInStoreOrder();
    void testDeferWatchesFollowUp();
    void testChainedDeferral();
    void testCancelWatchesOnDelete();
    void testFollowUpDroppedWhenOriginGone();
    void testBackgroundScanFires();
    void testStopInterruptsRingingAlarm();
    void testFailedFollowUpReturnsAlarmToScan();
    void testWatchThreadFiresFollowUp();
    void testCancelSleepingWatchThread();
    void testStopKeepsPendingSnoozeForRestart();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void SchedulerLoopTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void SchedulerLoopTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void SchedulerLoopTests::testNothingDue()
{
    Fixture f;
    f.addAlarm(10, 0);
    f.answer(reveille::FiringDecision::Dismiss);

    QVERIFY(!f.loop.scanOnce(reveille::localTimeToday(9, 59)).has_value());
    QCOMPARE(f.prompt.presentedCount.load(), 0);
}

void SchedulerLoopTests::testDisabledAlarmDoesNotFire()
{
    Fixture f;
    f.addAlarm(9, 0);
    f.store.toggleEnabled(0);
    f.answer(reveille::FiringDecision::Dismiss);

    QVERIFY(!f.loop.scanOnce(f.now).has_value());
    QCOMPARE(f.prompt.presentedCount.load(), 0);
}

void SchedulerLoopTests::testFiresOncePerMinute()
{
    Fixture f;
    f.addAlarm(9, 0);
    f.answer(reveille::FiringDecision::Dismiss);

    const auto first = f.loop.scanOnce(reveille::localTimeToday(9, 0, 5));
    QVERIFY(first.has_value());
    QCOMPARE(first->outcome, reveille::FiringOutcome::Dismissed);

    QVERIFY(!f.loop.scanOnce(reveille::localTimeToday(9, 0, 35)).has_value());
    QCOMPARE(f.prompt.presentedCount.load(), 1);
}

void SchedulerLoopTests::testSameMinuteAlarmsFireInStoreOrder()
{
    Fixture f;
    const auto first = f.addAlarm(9, 0, "first");
    const auto second = f.addAlarm(9, 0, "second");

    std::vector<reveille::TriggerId> order;
    std::optional<reveille::FiringResult> nested;
    bool nestedRan = false;
    f.prompt.onPresent = [&](const reveille::Trigger &trigger) {
        order.push_back(trigger.id);
        if (!nestedRan) {
            nestedRan = true;
            nested = f.loop.scanOnce(f.now);
        }
        f.coordinator.responseChannel().post(reveille::FiringDecision::Dismiss);
    };

    const auto firstResult = f.loop.scanOnce(f.now);
    QVERIFY(firstResult.has_value());
    QCOMPARE(firstResult->fired.id, first);
    QVERIFY(nestedRan);
    QVERIFY(!nested.has_value());

    const auto secondResult = f.loop.scanOnce(f.now.load() + 1s);
    QVERIFY(secondResult.has_value());
    QCOMPARE(secondResult->fired.id, second);

    QVERIFY(!f.loop.scanOnce(f.now.load() + 2s).has_value());
    QCOMPARE(order.size(), static_cast<std::size_t>(2));
}

void SchedulerLoopTests::testDeferWatchesFollowUp()
{
    Fixture f;
    const auto id = f.addAlarm(9, 0, "Standup");
    f.answer(reveille::FiringDecision::Defer);

    const auto result = f.loop.scanOnce(f.now);
    QVERIFY(result.has_value());
    QCOMPARE(result->outcome, reveille::FiringOutcome::Deferred);

    const auto pending = f.loop.pendingDeferrals();
    QCOMPARE(pending.size(), static_cast<std::size_t>(1));
    QCOMPARE(pending.front().fireTime, (reveille::TimeOfDay{9, 5}));
    QVERIFY(f.store.get(id)->deferred);
    QCOMPARE(f.store.get(id)->deferCount, 1);

    // The deferred store member is not rescanned.
    QVERIFY(!f.loop.scanOnce(f.now.load() + 30s).has_value());
    QVERIFY(f.loop.checkWatches(reveille::localTimeToday(9, 4)).empty());

    f.answer(reveille::FiringDecision::Dismiss);
    f.now = reveille::localTimeToday(9, 5);
    const auto fired = f.loop.checkWatches(f.now);
    QCOMPARE(fired.size(), static_cast<std::size_t>(1));
    QCOMPARE(fired.front().outcome, reveille::FiringOutcome::Dismissed);
    QCOMPARE(QString::fromStdString(fired.front().fired.label),
             QStringLiteral("Standup (Snooze 1)"));

    QVERIFY(f.loop.pendingDeferrals().empty());
    QVERIFY(!f.store.get(id)->deferred);
    QCOMPARE(f.store.get(id)->deferCount, 0);
}

void SchedulerLoopTests::testChainedDeferral()
{
    Fixture f;
    const auto id = f.addAlarm(9, 0);
    f.answer(reveille::FiringDecision::Defer);

    QVERIFY(f.loop.scanOnce(f.now).has_value());
    f.now = reveille::localTimeToday(9, 5);
    const auto second = f.loop.checkWatches(f.now);
    QCOMPARE(second.size(), static_cast<std::size_t>(1));
    QCOMPARE(second.front().outcome, reveille::FiringOutcome::Deferred);

    const auto pending = f.loop.pendingDeferrals();
    QCOMPARE(pending.size(), static_cast<std::size_t>(1));
    QCOMPARE(pending.front().fireTime, (reveille::TimeOfDay{9, 10}));
    QCOMPARE(pending.front().deferCount, 2);
    QCOMPARE(f.store.get(id)->deferCount, 2);
}

void SchedulerLoopTests::testCancelWatchesOnDelete()
{
    Fixture f;
    const auto id = f.addAlarm(9, 0);
    f.answer(reveille::FiringDecision::Defer);
    QVERIFY(f.loop.scanOnce(f.now).has_value());

    f.store.remove(0);
    QCOMPARE(f.loop.cancelWatchesFor(id), static_cast<std::size_t>(1));
    QVERIFY(f.loop.pendingDeferrals().empty());
    QVERIFY(f.loop.checkWatches(reveille::localTimeToday(9, 5)).empty());
    QCOMPARE(f.prompt.presentedCount.load(), 1);
}

void SchedulerLoopTests::testFollowUpDroppedWhenOriginGone()
{
    Fixture f;
    reveille::Trigger orphan;
    orphan.id = 77;
    orphan.originId = 77;
    orphan.fireTime = {9, 5};

    f.loop.watch(orphan);
    QVERIFY(f.loop.pendingDeferrals().empty());
}

void SchedulerLoopTests::testBackgroundScanFires()
{
    Fixture f(5s, 20ms);
    f.addAlarm(9, 0);
    f.answer(reveille::FiringDecision::Dismiss);

    f.loop.start();
    QVERIFY(f.loop.isRunning());
    QTRY_COMPARE(f.prompt.reportedCount.load(), 1);
    f.loop.stop();

    QVERIFY(!f.loop.isRunning());
    QCOMPARE(f.prompt.presentedCount.load(), 1);
}

void SchedulerLoopTests::testStopInterruptsRingingAlarm()
{
    Fixture f(30s, 20ms);
    f.addAlarm(9, 0);

    f.loop.start();
    QTRY_VERIFY(!f.coordinator.isIdle());

    const auto started = std::chrono::steady_clock::now();
    f.loop.stop();
    QVERIFY(std::chrono::steady_clock::now() - started < 5s);
    QVERIFY(f.coordinator.isIdle());
    QCOMPARE(f.prompt.reportedCount.load(), 1);
}

void SchedulerLoopTests::testFailedFollowUpReturnsAlarmToScan()
{
    Fixture f;
    const auto id = f.addAlarm(9, 0);
    f.answer(reveille::FiringDecision::Defer);
    QVERIFY(f.loop.scanOnce(f.now).has_value());
    QVERIFY(f.store.get(id)->deferred);

    f.prompt.onPresent = [](const reveille::Trigger &) {
        throw std::runtime_error("terminal gone");
    };
    QVERIFY_EXCEPTION_THROWN(f.loop.checkWatches(reveille::localTimeToday(9, 5)),
                             std::runtime_error);

    QVERIFY(f.loop.pendingDeferrals().empty());
    QVERIFY(!f.store.get(id)->deferred);
    QCOMPARE(f.store.get(id)->deferCount, 0);

    f.answer(reveille::FiringDecision::Dismiss);
    const auto nextDay = f.loop.scanOnce(reveille::localTimeToday(9, 0) + 24h);
    QVERIFY(nextDay.has_value());
    QCOMPARE(nextDay->fired.id, id);
}

void SchedulerLoopTests::testWatchThreadFiresFollowUp()
{
    Fixture f(5s, 20ms);
    const auto id = f.addAlarm(9, 0, "Standup");
    f.answer(reveille::FiringDecision::Defer);

    f.loop.start();
    QTRY_COMPARE(f.prompt.reportedCount.load(), 1);
    QTRY_COMPARE(f.loop.pendingDeferrals().size(), static_cast<std::size_t>(1));
    QTRY_COMPARE(f.loop.liveWatchThreads(), static_cast<std::size_t>(1));
    QVERIFY(f.store.get(id)->deferred);

    f.answer(reveille::FiringDecision::Dismiss);
    f.now = reveille::localTimeToday(9, 5);
    QTRY_COMPARE(f.prompt.reportedCount.load(), 2);
    QTRY_VERIFY(f.loop.pendingDeferrals().empty());
    QVERIFY(!f.store.get(id)->deferred);

    // The finished watch thread is joined by the scan thread.
    QTRY_COMPARE(f.loop.liveWatchThreads(), static_cast<std::size_t>(0));
    f.loop.stop();
    QCOMPARE(f.prompt.presentedCount.load(), 2);
}

void SchedulerLoopTests::testCancelSleepingWatchThread()
{
    Fixture f(5s, 20ms);
    const auto id = f.addAlarm(9, 0);
    f.answer(reveille::FiringDecision::Defer);

    f.loop.start();
    QTRY_COMPARE(f.loop.liveWatchThreads(), static_cast<std::size_t>(1));

    f.store.remove(0);
    QCOMPARE(f.loop.cancelWatchesFor(id), static_cast<std::size_t>(1));
    QVERIFY(f.loop.pendingDeferrals().empty());
    QTRY_COMPARE(f.loop.liveWatchThreads(), static_cast<std::size_t>(0));

    f.now = reveille::localTimeToday(9, 5);
    QTest::qWait(200);
    QCOMPARE(f.prompt.presentedCount.load(), 1);
    f.loop.stop();
}

void SchedulerLoopTests::testStopKeepsPendingSnoozeForRestart()
{
    Fixture f(5s, 20ms);
    const auto id = f.addAlarm(9, 0);
    f.answer(reveille::FiringDecision::Defer);

    f.loop.start();
    QTRY_COMPARE(f.loop.liveWatchThreads(), static_cast<std::size_t>(1));

    const auto started = std::chrono::steady_clock::now();
    f.loop.stop();
    QVERIFY(std::chrono::steady_clock::now() - started < 2s);
    QCOMPARE(f.loop.liveWatchThreads(), static_cast<std::size_t>(0));

    const auto pending = f.loop.pendingDeferrals();
    QCOMPARE(pending.size(), static_cast<std::size_t>(1));
    QCOMPARE(pending.front().fireTime, (reveille::TimeOfDay{9, 5}));
    QVERIFY(f.store.get(id)->deferred);

    f.answer(reveille::FiringDecision::Dismiss);
    f.now = reveille::localTimeToday(9, 5);
    f.loop.start();
    QTRY_COMPARE(f.prompt.reportedCount.load(), 2);
    QTRY_VERIFY(f.loop.pendingDeferrals().empty());
    QVERIFY(!f.store.get(id)->deferred);
    f.loop.stop();
}

QTEST_MAIN(SchedulerLoopTests)
#include "test_scheduler_loop.moc"
