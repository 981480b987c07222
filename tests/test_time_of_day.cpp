#include <QtTest/QtTest>

#include <string>

#include "common/time_of_day.hpp"

class TimeOfDayTests : public QObject
{
    Q_OBJECT
private slots:
    void testParseValid_data();
    void testParseValid();
    void testParseRejects_data();
    void testParseRejects();
    void testFormatPadsWithZeros();
    void testTimeOfDayAtDropsSeconds();
    void testMinuteStampGroupsSameMinute();
};

void TimeOfDayTests::testParseValid_data()
{
    QTest::addColumn<QString>("input");
    QTest::addColumn<int>("hour");
    QTest::addColumn<int>("minute");

    QTest::newRow("midnight") << QStringLiteral("00:00") << 0 << 0;
    QTest::newRow("afternoon") << QStringLiteral("14:30") << 14 << 30;
    QTest::newRow("last minute") << QStringLiteral("23:59") << 23 << 59;
    QTest::newRow("single digit hour") << QStringLiteral("9:05") << 9 << 5;
    QTest::newRow("surrounding spaces") << QStringLiteral("  07:15 ") << 7 << 15;
}

void TimeOfDayTests::testParseValid()
{
    QFETCH(QString, input);
    QFETCH(int, hour);
    QFETCH(int, minute);

    const auto parsed = reveille::parseTimeOfDay(input.toStdString());
    QVERIFY(parsed.has_value());
    QCOMPARE(parsed->hour, hour);
    QCOMPARE(parsed->minute, minute);
    QVERIFY(reveille::validateTime(input.toStdString()));
}

void TimeOfDayTests::testParseRejects_data()
{
    QTest::addColumn<QString>("input");

    QTest::newRow("empty") << QString();
    QTest::newRow("seconds") << QStringLiteral("12:30:00");
    QTest::newRow("hour 24") << QStringLiteral("24:00");
    QTest::newRow("minute 60") << QStringLiteral("12:60");
    QTest::newRow("letters") << QStringLiteral("ab:cd");
    QTest::newRow("no colon") << QStringLiteral("1230");
    QTest::newRow("negative") << QStringLiteral("-1:30");
    QTest::newRow("missing minute") << QStringLiteral("12:");
    QTest::newRow("huge") << QStringLiteral("99999999999:00");
}

void TimeOfDayTests::testParseRejects()
{
    QFETCH(QString, input);
    QVERIFY(!reveille::parseTimeOfDay(input.toStdString()).has_value());
    QVERIFY(!reveille::validateTime(input.toStdString()));
}

void TimeOfDayTests::testFormatPadsWithZeros()
{
    QCOMPARE(QString::fromStdString(reveille::formatTimeOfDay({7, 5})), QStringLiteral("07:05"));
    QCOMPARE(QString::fromStdString(reveille::formatTimeOfDay({23, 59})), QStringLiteral("23:59"));
}

void TimeOfDayTests::testTimeOfDayAtDropsSeconds()
{
    const auto at = reveille::localTimeToday(10, 42, 37);
    const reveille::TimeOfDay time = reveille::timeOfDayAt(at);
    QCOMPARE(time.hour, 10);
    QCOMPARE(time.minute, 42);
}

void TimeOfDayTests::testMinuteStampGroupsSameMinute()
{
    const auto first = reveille::localTimeToday(8, 15, 0);
    const auto later = reveille::localTimeToday(8, 15, 59);
    const auto next = reveille::localTimeToday(8, 16, 0);
    QCOMPARE(reveille::minuteStamp(first), reveille::minuteStamp(later));
    QCOMPARE(reveille::minuteStamp(next), reveille::minuteStamp(first) + 1);
}

QTEST_MAIN(TimeOfDayTests)
#include "test_time_of_day.moc"
