#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace reveille::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main(). An empty
// logsDir means $HOME/.local/share/reveille/logs.
void initLogging(const QString &processName, bool traceEnabled, const QString &logsDir = QString());

// Directory holding <process>.log and <process>-trace.log.
QString logsDirPath();

// Names the calling thread ("console", "scan", "watch-3") in its events.
// Threads without a role are logged by their native id.
void setThreadRole(const QString &role);

// Thread-local correlation support, used to tie together the events of one
// firing episode. A firing runs on the scan or a watch thread while the
// console thread answers it, so the id is carried explicitly across threads.
QString currentCorrelationId();
QString newCorrelationId(const QString &prefix);

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();

} // namespace reveille::logging

#define RLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::reveille::logging::logEvent(::reveille::logging::LogLevel::Debug, \
                                  ::reveille::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define RLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::reveille::logging::logEvent(::reveille::logging::LogLevel::Info, \
                                  ::reveille::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define RLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::reveille::logging::logEvent(::reveille::logging::LogLevel::Warn, \
                                  ::reveille::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define RLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::reveille::logging::logEvent(::reveille::logging::LogLevel::Error, \
                                  ::reveille::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
