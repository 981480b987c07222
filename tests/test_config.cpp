#include <QtTest/QtTest>

#include <QTemporaryDir>

#include "common/config.hpp"

class ConfigTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void cleanup();
    void testDefaults();
    void testEnvironmentOverrides();
    void testInvalidValuesKeepDefaults();
    void testParseSecondsSetting();
    void testDataDirOverride();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

namespace {

const char *const kVariables[] = {
    "REVEILLE_SCAN_INTERVAL_SEC",
    "REVEILLE_RESPONSE_TIMEOUT_SEC",
    "REVEILLE_TONE_DIR",
    "REVEILLE_PLAYER",
    "REVEILLE_TRACE",
    "REVEILLE_DATA_DIR",
};

} // namespace

void ConfigTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    cleanup();
}

void ConfigTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ConfigTests::cleanup()
{
    for (const char *name : kVariables) {
        qunsetenv(name);
    }
}

void ConfigTests::testDefaults()
{
    const reveille::AppConfig config = reveille::loadConfigFromEnvironment();
    QCOMPARE(config.scanInterval, std::chrono::seconds(30));
    QCOMPARE(config.responseTimeout, std::chrono::seconds(30));
    QCOMPARE(config.toneDir, QStringLiteral("alarm_tones"));
    QCOMPARE(config.dataDir, m_tempDir.path() + QStringLiteral("/.local/share/reveille"));
    QVERIFY(config.playerCommand.isEmpty());
    QVERIFY(config.persist);
    QVERIFY(!config.traceEnabled);
}

void ConfigTests::testEnvironmentOverrides()
{
    qputenv("REVEILLE_SCAN_INTERVAL_SEC", "5");
    qputenv("REVEILLE_RESPONSE_TIMEOUT_SEC", " 45 ");
    qputenv("REVEILLE_TONE_DIR", "/opt/tones");
    qputenv("REVEILLE_PLAYER", "aplay -q");
    qputenv("REVEILLE_TRACE", "1");

    const reveille::AppConfig config = reveille::loadConfigFromEnvironment();
    QCOMPARE(config.scanInterval, std::chrono::seconds(5));
    QCOMPARE(config.responseTimeout, std::chrono::seconds(45));
    QCOMPARE(config.toneDir, QStringLiteral("/opt/tones"));
    QCOMPARE(config.playerCommand, QStringLiteral("aplay -q"));
    QVERIFY(config.traceEnabled);
}

void ConfigTests::testInvalidValuesKeepDefaults()
{
    qputenv("REVEILLE_SCAN_INTERVAL_SEC", "soon");
    qputenv("REVEILLE_RESPONSE_TIMEOUT_SEC", "0");

    const reveille::AppConfig config = reveille::loadConfigFromEnvironment();
    QCOMPARE(config.scanInterval, std::chrono::seconds(30));
    QCOMPARE(config.responseTimeout, std::chrono::seconds(30));
}

void ConfigTests::testParseSecondsSetting()
{
    std::chrono::seconds value(7);
    QVERIFY(reveille::parseSecondsSetting(QStringLiteral("1"), value));
    QCOMPARE(value, std::chrono::seconds(1));
    QVERIFY(reveille::parseSecondsSetting(QStringLiteral("3600"), value));
    QCOMPARE(value, std::chrono::seconds(3600));

    QVERIFY(!reveille::parseSecondsSetting(QStringLiteral("3601"), value));
    QVERIFY(!reveille::parseSecondsSetting(QStringLiteral("-4"), value));
    QVERIFY(!reveille::parseSecondsSetting(QStringLiteral("1.5"), value));
    QVERIFY(!reveille::parseSecondsSetting(QString(), value));
    QCOMPARE(value, std::chrono::seconds(3600));
}

void ConfigTests::testDataDirOverride()
{
    qputenv("REVEILLE_DATA_DIR", "/var/lib/reveille");
    QCOMPARE(reveille::defaultDataDir(), QStringLiteral("/var/lib/reveille"));
    QCOMPARE(reveille::loadConfigFromEnvironment().dataDir, QStringLiteral("/var/lib/reveille"));
}

QTEST_MAIN(ConfigTests)
#include "test_config.moc"
