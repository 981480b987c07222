#include "common/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <atomic>
#include <mutex>

namespace reveille::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

std::mutex g_logMutex;
bool g_traceEnabled = false;
QString g_processName;
QString g_logsDir;
std::atomic<quint64> g_corrCounter{0};

thread_local QString t_corrId;
thread_local QString t_threadRole;

QString levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

QString logFilePath(const QString &processName, const QString &suffix)
{
    const QString base = processName.isEmpty()
        ? QStringLiteral("reveille")
        : processName;
    return logsDirPath() + QDir::separator() + base + suffix;
}

void rotateIfNeeded(const QString &path)
{
    QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    const QString rotated = path + QStringLiteral(".1");
    QFile::remove(rotated);
    QFile::rename(path, rotated);
}

void writeLine(const QString &path, const QString &line)
{
    QDir().mkpath(logsDirPath());
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "%s\n", line.toUtf8().constData());
        return;
    }

    file.write(line.toUtf8());
    file.write("\n");
}

QString threadName()
{
    if (!t_threadRole.isEmpty()) {
        return t_threadRole;
    }
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled, const QString &logsDir)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = processName;
    g_traceEnabled = traceEnabled;
    g_logsDir = logsDir;
}

QString logsDirPath()
{
    if (!g_logsDir.isEmpty()) {
        return g_logsDir;
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/reveille/logs");
    }
    return home + QStringLiteral("/.local/share/reveille/logs");
}

void setThreadRole(const QString &role)
{
    t_threadRole = role;
}

QString currentCorrelationId()
{
    return t_corrId;
}

QString newCorrelationId(const QString &prefix)
{
    return QStringLiteral("%1-%2-%3")
        .arg(prefix)
        .arg(QDateTime::currentMSecsSinceEpoch())
        .arg(++g_corrCounter);
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    return g_processName.isEmpty() ? QStringLiteral("reveille") : g_processName;
}

QString defaultWho()
{
    // The alarm clock runs for one user on one terminal; resolve it once.
    static const QString who = [] {
        char hostname[256] = {};
        if (gethostname(hostname, sizeof(hostname)) != 0) {
            hostname[0] = '\0';
        }
        return QStringLiteral("host:%1,uid:%2")
            .arg(QString::fromUtf8(hostname))
            .arg(static_cast<int>(getuid()));
    }();
    return who;
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;
    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level).toStdString()},
        {"process", processName.toStdString()},
        {"thread", threadName().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };

    const QString line = QString::fromStdString(payload.dump());

    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const QString mainPath = logFilePath(process, QStringLiteral(".log"));
    const QString tracePath = logFilePath(process, QStringLiteral("-trace.log"));

    std::lock_guard<std::mutex> lock(g_logMutex);
    if (level != LogLevel::Debug) {
        writeLine(mainPath, line);
    } else if (g_traceEnabled) {
        writeLine(mainPath, line);
    }

    if (g_traceEnabled) {
        writeLine(tracePath, line);
    }
}

} // namespace reveille::logging
