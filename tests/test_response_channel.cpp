#include <QtTest/QtTest>

#include <chrono>
#include <thread>

#include "scheduler/response_channel.hpp"

using namespace std::chrono_literals;

class ResponseChannelTests : public QObject
{
    Q_OBJECT
private slots:
    void testPostRejectedWhileClosed();
    void testDecisionDelivered();
    void testSecondPostRejected();
    void testTimeoutDefers();
    void testInterruptDismisses();
    void testShutdownSurvivesOpen();
    void testDecisionFromOtherThread();
};

void ResponseChannelTests::testPostRejectedWhileClosed()
{
    reveille::ResponseChannel channel;
    QVERIFY(!channel.isOpen());
    QVERIFY(!channel.post(reveille::FiringDecision::Dismiss));
    QVERIFY(!channel.requestInterrupt());

    channel.open();
    channel.close();
    QVERIFY(!channel.post(reveille::FiringDecision::Defer));
}

void ResponseChannelTests::testDecisionDelivered()
{
    reveille::ResponseChannel channel;
    channel.open();
    QVERIFY(channel.post(reveille::FiringDecision::Dismiss));

    const auto response = channel.await(5s);
    QCOMPARE(response.cause, reveille::ResolutionCause::UserChoice);
    QCOMPARE(response.decision, reveille::FiringDecision::Dismiss);
    channel.close();
}

void ResponseChannelTests::testSecondPostRejected()
{
    reveille::ResponseChannel channel;
    channel.open();
    QVERIFY(channel.post(reveille::FiringDecision::Defer));
    QVERIFY(!channel.post(reveille::FiringDecision::Dismiss));

    const auto response = channel.await(5s);
    QCOMPARE(response.decision, reveille::FiringDecision::Defer);
}

void ResponseChannelTests::testTimeoutDefers()
{
    reveille::ResponseChannel channel;
    channel.open();

    const auto started = std::chrono::steady_clock::now();
    const auto response = channel.await(150ms);
    const auto waited = std::chrono::steady_clock::now() - started;

    QCOMPARE(response.cause, reveille::ResolutionCause::Timeout);
    QCOMPARE(response.decision, reveille::FiringDecision::Defer);
    QVERIFY(waited >= 150ms);
}

void ResponseChannelTests::testInterruptDismisses()
{
    reveille::ResponseChannel channel;
    channel.open();
    QVERIFY(channel.requestInterrupt());

    const auto response = channel.await(5s);
    QCOMPARE(response.cause, reveille::ResolutionCause::Interrupt);
    QCOMPARE(response.decision, reveille::FiringDecision::Dismiss);
    channel.close();

    // A stale interrupt must not leak into the next alarm.
    channel.open();
    const auto next = channel.await(50ms);
    QCOMPARE(next.cause, reveille::ResolutionCause::Timeout);
}

void ResponseChannelTests::testShutdownSurvivesOpen()
{
    reveille::ResponseChannel channel;
    channel.shutdown();
    channel.open();

    const auto response = channel.await(5s);
    QCOMPARE(response.cause, reveille::ResolutionCause::Interrupt);

    channel.resume();
    const auto resumed = channel.await(50ms);
    QCOMPARE(resumed.cause, reveille::ResolutionCause::Timeout);
}

void ResponseChannelTests::testDecisionFromOtherThread()
{
    reveille::ResponseChannel channel;
    channel.open();

    std::thread answer([&channel] {
        while (!channel.post(reveille::FiringDecision::Dismiss)) {
            std::this_thread::sleep_for(5ms);
        }
    });
    const auto response = channel.await(5s);
    answer.join();

    QCOMPARE(response.cause, reveille::ResolutionCause::UserChoice);
    QCOMPARE(response.decision, reveille::FiringDecision::Dismiss);
}

QTEST_MAIN(ResponseChannelTests)
#include "test_response_channel.moc"
