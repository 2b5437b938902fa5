#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace rewind::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Thread-local correlation support; history operations use the run id.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

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

QString logsDirPath();
QString defaultProcessName();
QString defaultWho();

} // namespace rewind::logging

#define RLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::rewind::logging::logEvent(::rewind::logging::LogLevel::Debug, \
                                ::rewind::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define RLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::rewind::logging::logEvent(::rewind::logging::LogLevel::Info, \
                                ::rewind::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define RLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::rewind::logging::logEvent(::rewind::logging::LogLevel::Warn, \
                                ::rewind::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define RLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::rewind::logging::logEvent(::rewind::logging::LogLevel::Error, \
                                ::rewind::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
