#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace honeyforge::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Thread-local correlation support for linking the events of one deployment.
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

// $HOME/.local/share/honeyforge[/leaf]
QString dataDirPath(const QString &leaf = QString());

// HONEYFORGE_LOG_DIR, or dataDirPath("logs").
QString logsDirPath();
QString logFilePath(const QString &processName, bool trace);

} // namespace honeyforge::logging

#define HFLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::honeyforge::logging::logEvent(::honeyforge::logging::LogLevel::Debug, \
                                    ::honeyforge::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define HFLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::honeyforge::logging::logEvent(::honeyforge::logging::LogLevel::Info, \
                                    ::honeyforge::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define HFLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::honeyforge::logging::logEvent(::honeyforge::logging::LogLevel::Warn, \
                                    ::honeyforge::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define HFLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::honeyforge::logging::logEvent(::honeyforge::logging::LogLevel::Error, \
                                    ::honeyforge::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
