#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace scorebook::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Thread-local correlation support; the pipeline uses the game id.
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

QString defaultProcessName();
QString defaultWho();

// Directory holding the process log files.
QString logsDirPath();

} // namespace scorebook::logging

#define SBLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::scorebook::logging::logEvent(::scorebook::logging::LogLevel::Debug, \
                                   ::scorebook::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SBLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::scorebook::logging::logEvent(::scorebook::logging::LogLevel::Info, \
                                   ::scorebook::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SBLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::scorebook::logging::logEvent(::scorebook::logging::LogLevel::Warn, \
                                   ::scorebook::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SBLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::scorebook::logging::logEvent(::scorebook::logging::LogLevel::Error, \
                                   ::scorebook::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
