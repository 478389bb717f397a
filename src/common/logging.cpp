#include "common/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSysInfo>
#include <QThread>

#include <cstdio>

#if !defined(Q_OS_WIN)
#include <unistd.h>
#endif

namespace tunelog::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

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

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

QString defaultWho()
{
#if defined(Q_OS_WIN)
    return QStringLiteral("host:%1,user:%2")
        .arg(QSysInfo::machineHostName(), qEnvironmentVariable("USERNAME"));
#else
    return QStringLiteral("host:%1,uid:%2")
        .arg(QSysInfo::machineHostName())
        .arg(static_cast<int>(getuid()));
#endif
}

Logger::Logger(const QString &processName,
               const QString &filePath,
               bool traceEnabled,
               bool echoToConsole)
    : m_processName(processName.isEmpty() ? QStringLiteral("tunelog") : processName)
    , m_filePath(filePath)
    , m_traceEnabled(traceEnabled)
    , m_echoToConsole(echoToConsole)
    , m_who(defaultWho())
{
}

QString Logger::traceFilePath() const
{
    if (m_filePath.isEmpty()) {
        return QString();
    }
    QFileInfo info(m_filePath);
    return info.absolutePath() + QDir::separator() + info.completeBaseName()
        + QStringLiteral("-trace.log");
}

void Logger::setCorrelationId(const QString &corrId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_corrId = corrId;
}

QString Logger::correlationId() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_corrId;
}

void Logger::writeLine(const QString &path, const QString &line)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "%s\n", line.toUtf8().constData());
        return;
    }

    file.write(line.toUtf8());
    file.write("\n");
}

void Logger::logEvent(LogLevel level,
                      const QString &component,
                      const QString &where,
                      const QString &what,
                      const QString &why,
                      const QString &how,
                      const nlohmann::json &context)
{
    const QDateTime now = QDateTime::currentDateTimeUtc();

    std::lock_guard<std::mutex> lock(m_mutex);
    nlohmann::json payload = {
        {"ts", now.toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level).toStdString()},
        {"process", m_processName.toStdString()},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", m_who.toStdString()},
        {"corr", m_corrId.toStdString()},
        {"context", context}
    };

    const QString line = QString::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    if (m_echoToConsole && (level != LogLevel::Debug || m_traceEnabled)) {
        fprintf(stderr, "%s [%s] %s: %s\n",
                now.toLocalTime().toString(QStringLiteral("HH:mm:ss")).toUtf8().constData(),
                levelToString(level).toUtf8().constData(),
                component.toUtf8().constData(),
                what.toUtf8().constData());
    }

    if (m_filePath.isEmpty()) {
        return;
    }

    if (level != LogLevel::Debug || m_traceEnabled) {
        writeLine(m_filePath, line);
    }

    if (m_traceEnabled) {
        writeLine(traceFilePath(), line);
    }
}

} // namespace tunelog::logging
