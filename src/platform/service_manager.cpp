#include "platform/service_manager.hpp"

#include <QRegularExpression>
#include <QStringList>
#include <QThread>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "platform/platform_error.hpp"

namespace tunelog {

namespace {

constexpr int kScServiceDoesNotExist = 1060;
constexpr int kScAccessDenied = 5;
constexpr int kScAlreadyRunning = 1056;
constexpr int kScNotActive = 1062;
constexpr int kPendingPollMs = 250;
constexpr int kPendingTimeoutMs = 15000;

CommandOutput runLogged(logging::Logger &logger,
                        const QString &component,
                        const QString &program,
                        const QStringList &args)
{
    const CommandOutput output = runCommand(program, args);
    TLOG_DEBUG(logger,
               component,
               QStringLiteral("runLogged"),
               QStringLiteral("command_finished"),
               QStringLiteral("service_control"),
               program,
               (nlohmann::json{{"args", args.join(QLatin1Char(' ')).toStdString()},
                               {"exitCode", output.exitCode},
                               {"started", output.started}}));
    if (!output.started) {
        throw PlatformError(PlatformErrorKind::NotFound,
                            program.toStdString() + " could not be started: "
                                + output.standardError.toStdString());
    }
    if (output.timedOut) {
        throw PlatformError(PlatformErrorKind::CommandFailed,
                            program.toStdString() + " timed out");
    }
    return output;
}

void throwForScExit(const CommandOutput &output, const std::string &what)
{
    if (output.exitCode == kScServiceDoesNotExist) {
        throw PlatformError(PlatformErrorKind::NotFound, what + ": service does not exist");
    }
    if (output.exitCode == kScAccessDenied) {
        throw PlatformError(PlatformErrorKind::PermissionDenied, what + ": access denied");
    }
    throw PlatformError(PlatformErrorKind::CommandFailed,
                        what + ": sc exit " + std::to_string(output.exitCode) + " "
                            + output.standardOutput.trimmed().toStdString());
}

ServiceStatus scStateToStatus(int state)
{
    switch (state) {
    case 1:
        return ServiceStatus::Stopped;
    case 2:
        return ServiceStatus::StartPending;
    case 3:
        return ServiceStatus::StopPending;
    case 4:
        return ServiceStatus::Running;
    case 7:
        return ServiceStatus::Paused;
    default:
        return ServiceStatus::Unknown;
    }
}

std::string scStartTypeToString(int startType, bool delayed)
{
    switch (startType) {
    case 0:
        return toStartupTypeString(StartupType::Boot);
    case 1:
        return toStartupTypeString(StartupType::System);
    case 2:
        return toStartupTypeString(delayed ? StartupType::AutomaticDelayed
                                           : StartupType::Automatic);
    case 3:
        return toStartupTypeString(StartupType::Manual);
    case 4:
        return toStartupTypeString(StartupType::Disabled);
    default:
        return "Unknown(" + std::to_string(startType) + ")";
    }
}

QString scStartArgument(StartupType type)
{
    switch (type) {
    case StartupType::Automatic:
        return QStringLiteral("auto");
    case StartupType::AutomaticDelayed:
        return QStringLiteral("delayed-auto");
    case StartupType::Manual:
        return QStringLiteral("demand");
    case StartupType::Disabled:
        return QStringLiteral("disabled");
    case StartupType::Boot:
        return QStringLiteral("boot");
    case StartupType::System:
        return QStringLiteral("system");
    }
    return QStringLiteral("demand");
}

bool isSystemdPermissionError(const CommandOutput &output)
{
    const QString text = output.standardError;
    return text.contains(QStringLiteral("Access denied"), Qt::CaseInsensitive)
        || text.contains(QStringLiteral("authentication required"), Qt::CaseInsensitive)
        || text.contains(QStringLiteral("Permission denied"), Qt::CaseInsensitive);
}

bool isSystemdMissingUnit(const CommandOutput &output)
{
    const QString text = output.standardError;
    return text.contains(QStringLiteral("not found"), Qt::CaseInsensitive)
        || text.contains(QStringLiteral("No such file"), Qt::CaseInsensitive)
        || text.contains(QStringLiteral("not loaded"), Qt::CaseInsensitive);
}

void checkSystemctl(const CommandOutput &output, const std::string &what)
{
    if (output.exitCode == 0) {
        return;
    }
    if (isSystemdPermissionError(output)) {
        throw PlatformError(PlatformErrorKind::PermissionDenied, what + ": access denied");
    }
    if (isSystemdMissingUnit(output)) {
        throw PlatformError(PlatformErrorKind::NotFound, what + ": unit not found");
    }
    throw PlatformError(PlatformErrorKind::CommandFailed,
                        what + ": " + output.standardError.trimmed().toStdString());
}

QString unitName(const std::string &name)
{
    const QString unit = QString::fromStdString(name);
    if (unit.contains(QLatin1Char('.'))) {
        return unit;
    }
    return unit + QStringLiteral(".service");
}

} // namespace

ScServiceManager::ScServiceManager(logging::Logger &logger)
    : m_logger(logger)
{
}

ServiceStateSnapshot ScServiceManager::query(const std::string &name)
{
    const QString service = QString::fromStdString(name);
    const QString component = QStringLiteral("ScServiceManager");

    const CommandOutput state = runLogged(m_logger, component, QStringLiteral("sc.exe"),
                                          {QStringLiteral("query"), service});
    if (state.exitCode != 0) {
        throwForScExit(state, "query " + name);
    }
    const CommandOutput config = runLogged(m_logger, component, QStringLiteral("sc.exe"),
                                           {QStringLiteral("qc"), service});
    if (config.exitCode != 0) {
        throwForScExit(config, "qc " + name);
    }

    static const QRegularExpression stateRe(QStringLiteral("STATE\\s*:\\s*(\\d+)"));
    static const QRegularExpression startRe(QStringLiteral("START_TYPE\\s*:\\s*(\\d+)([^\\r\\n]*)"));

    const auto stateMatch = stateRe.match(state.standardOutput);
    const auto startMatch = startRe.match(config.standardOutput);
    if (!stateMatch.hasMatch() || !startMatch.hasMatch()) {
        throw PlatformError(PlatformErrorKind::CommandFailed,
                            "unrecognized sc output for " + name);
    }

    ServiceStateSnapshot snapshot;
    snapshot.status = toServiceStatusString(scStateToStatus(stateMatch.captured(1).toInt()));
    snapshot.startupType = scStartTypeToString(
        startMatch.captured(1).toInt(),
        startMatch.captured(2).contains(QStringLiteral("DELAYED"), Qt::CaseInsensitive));
    return snapshot;
}

void ScServiceManager::setStartupType(const std::string &name, StartupType type)
{
    const CommandOutput output = runLogged(
        m_logger, QStringLiteral("ScServiceManager"), QStringLiteral("sc.exe"),
        {QStringLiteral("config"), QString::fromStdString(name), QStringLiteral("start="),
         scStartArgument(type)});
    if (output.exitCode != 0) {
        throwForScExit(output, "config " + name);
    }
}

void ScServiceManager::start(const std::string &name)
{
    const CommandOutput output = runLogged(
        m_logger, QStringLiteral("ScServiceManager"), QStringLiteral("sc.exe"),
        {QStringLiteral("start"), QString::fromStdString(name)});
    if (output.exitCode != 0 && output.exitCode != kScAlreadyRunning) {
        throwForScExit(output, "start " + name);
    }
    waitWhilePending(name);
}

void ScServiceManager::stop(const std::string &name)
{
    const CommandOutput output = runLogged(
        m_logger, QStringLiteral("ScServiceManager"), QStringLiteral("sc.exe"),
        {QStringLiteral("stop"), QString::fromStdString(name)});
    if (output.exitCode != 0 && output.exitCode != kScNotActive) {
        throwForScExit(output, "stop " + name);
    }
    waitWhilePending(name);
}

void ScServiceManager::waitWhilePending(const std::string &name)
{
    const std::string startPending = toServiceStatusString(ServiceStatus::StartPending);
    const std::string stopPending = toServiceStatusString(ServiceStatus::StopPending);
    for (int waited = 0; waited < kPendingTimeoutMs; waited += kPendingPollMs) {
        const ServiceStateSnapshot current = query(name);
        if (current.status != startPending && current.status != stopPending) {
            return;
        }
        QThread::msleep(kPendingPollMs);
    }
    TLOG_WARN(m_logger,
              QStringLiteral("ScServiceManager"),
              QStringLiteral("waitWhilePending"),
              QStringLiteral("service_still_pending"),
              QStringLiteral("state_transition_slow"),
              QStringLiteral("sc_query_poll"),
              (nlohmann::json{{"service", name}, {"waitedMs", kPendingTimeoutMs}}));
}

SystemdServiceManager::SystemdServiceManager(logging::Logger &logger)
    : m_logger(logger)
{
}

ServiceStateSnapshot SystemdServiceManager::query(const std::string &name)
{
    const QString unit = unitName(name);
    const QString component = QStringLiteral("SystemdServiceManager");

    const CommandOutput enabled = runLogged(m_logger, component, QStringLiteral("systemctl"),
                                            {QStringLiteral("is-enabled"), unit});
    const QString enabledState = enabled.standardOutput.trimmed();
    if (enabledState.isEmpty()) {
        checkSystemctl(enabled, "is-enabled " + name);
        throw PlatformError(PlatformErrorKind::CommandFailed,
                            "is-enabled " + name + ": no output");
    }

    const CommandOutput active = runLogged(m_logger, component, QStringLiteral("systemctl"),
                                           {QStringLiteral("is-active"), unit});
    const QString activeState = active.standardOutput.trimmed();

    ServiceStateSnapshot snapshot;
    if (activeState == QStringLiteral("active") || activeState == QStringLiteral("reloading")) {
        snapshot.status = toServiceStatusString(ServiceStatus::Running);
    } else if (activeState == QStringLiteral("activating")) {
        snapshot.status = toServiceStatusString(ServiceStatus::StartPending);
    } else if (activeState == QStringLiteral("deactivating")) {
        snapshot.status = toServiceStatusString(ServiceStatus::StopPending);
    } else {
        snapshot.status = toServiceStatusString(ServiceStatus::Stopped);
    }

    if (enabledState.startsWith(QStringLiteral("enabled"))) {
        snapshot.startupType = toStartupTypeString(StartupType::Automatic);
    } else if (enabledState.startsWith(QStringLiteral("masked"))) {
        snapshot.startupType = toStartupTypeString(StartupType::Disabled);
    } else {
        snapshot.startupType = toStartupTypeString(StartupType::Manual);
    }
    return snapshot;
}

void SystemdServiceManager::setStartupType(const std::string &name, StartupType type)
{
    const QString unit = unitName(name);
    const QString component = QStringLiteral("SystemdServiceManager");
    const QString systemctl = QStringLiteral("systemctl");

    if (type == StartupType::Disabled) {
        checkSystemctl(runLogged(m_logger, component, systemctl,
                                 {QStringLiteral("disable"), unit}),
                       "disable " + name);
        checkSystemctl(runLogged(m_logger, component, systemctl,
                                 {QStringLiteral("mask"), unit}),
                       "mask " + name);
        return;
    }

    checkSystemctl(runLogged(m_logger, component, systemctl,
                             {QStringLiteral("unmask"), unit}),
                   "unmask " + name);
    const QString verb = type == StartupType::Manual ? QStringLiteral("disable")
                                                     : QStringLiteral("enable");
    checkSystemctl(runLogged(m_logger, component, systemctl, {verb, unit}),
                   verb.toStdString() + " " + name);
}

void SystemdServiceManager::start(const std::string &name)
{
    checkSystemctl(runLogged(m_logger, QStringLiteral("SystemdServiceManager"),
                             QStringLiteral("systemctl"),
                             {QStringLiteral("start"), unitName(name)}),
                   "start " + name);
}

void SystemdServiceManager::stop(const std::string &name)
{
    checkSystemctl(runLogged(m_logger, QStringLiteral("SystemdServiceManager"),
                             QStringLiteral("systemctl"),
                             {QStringLiteral("stop"), unitName(name)}),
                   "stop " + name);
}

} // namespace tunelog
