#pragma once

#include <memory>
#include <mutex>

#include <QString>

#include <nlohmann/json.hpp>

namespace tunelog::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

QString defaultWho();

// Structured JSON-lines logger bound to one file. Instances are created by
// the entry points and handed to every component that logs; there is no
// process-wide logger.
class Logger {
public:
    // An empty filePath keeps only the console echo (if enabled).
    Logger(const QString &processName,
           const QString &filePath,
           bool traceEnabled = false,
           bool echoToConsole = false);

    const QString &processName() const { return m_processName; }
    const QString &filePath() const { return m_filePath; }
    QString traceFilePath() const;
    bool isTraceEnabled() const { return m_traceEnabled; }

    // Default correlation id for events logged without one; the run id.
    void setCorrelationId(const QString &corrId);
    QString correlationId() const;

    // All fields are required; use empty strings where unknown.
    void logEvent(LogLevel level,
                  const QString &component,
                  const QString &where,
                  const QString &what,
                  const QString &why,
                  const QString &how,
                  const nlohmann::json &context = nlohmann::json::object());

private:
    void writeLine(const QString &path, const QString &line);

    QString m_processName;
    QString m_filePath;
    bool m_traceEnabled = false;
    bool m_echoToConsole = false;
    QString m_corrId;
    QString m_who;
    mutable std::mutex m_mutex;
};

} // namespace tunelog::logging

#define TLOG_DEBUG(logger, component, where, what, why, how, ctxJson) \
    (logger).logEvent(::tunelog::logging::LogLevel::Debug, \
                      (component), (where), (what), (why), (how), (ctxJson))

#define TLOG_INFO(logger, component, where, what, why, how, ctxJson) \
    (logger).logEvent(::tunelog::logging::LogLevel::Info, \
                      (component), (where), (what), (why), (how), (ctxJson))

#define TLOG_WARN(logger, component, where, what, why, how, ctxJson) \
    (logger).logEvent(::tunelog::logging::LogLevel::Warn, \
                      (component), (where), (what), (why), (how), (ctxJson))

#define TLOG_ERROR(logger, component, where, what, why, how, ctxJson) \
    (logger).logEvent(::tunelog::logging::LogLevel::Error, \
                      (component), (where), (what), (why), (how), (ctxJson))
