#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace contmon::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Directory holding <process>.log; CONTMON_LOG_DIR overrides the default
// $HOME/.local/share/contmon/logs.
QString logsDirPath();

// Thread-local correlation support; the daemon tags every cycle with one.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event, written as one JSON line. Use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();

} // namespace contmon::logging

#define CMLOG_DEBUG(component, where, what, why, corr, ctxJson) \
    ::contmon::logging::logEvent(::contmon::logging::LogLevel::Debug, \
                                 ::contmon::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), \
                                 ::contmon::logging::defaultWho(), (corr), (ctxJson))

#define CMLOG_INFO(component, where, what, why, corr, ctxJson) \
    ::contmon::logging::logEvent(::contmon::logging::LogLevel::Info, \
                                 ::contmon::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), \
                                 ::contmon::logging::defaultWho(), (corr), (ctxJson))

#define CMLOG_WARN(component, where, what, why, corr, ctxJson) \
    ::contmon::logging::logEvent(::contmon::logging::LogLevel::Warn, \
                                 ::contmon::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), \
                                 ::contmon::logging::defaultWho(), (corr), (ctxJson))

#define CMLOG_ERROR(component, where, what, why, corr, ctxJson) \
    ::contmon::logging::logEvent(::contmon::logging::LogLevel::Error, \
                                 ::contmon::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), \
                                 ::contmon::logging::defaultWho(), (corr), (ctxJson))
