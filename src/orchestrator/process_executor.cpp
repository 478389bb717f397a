#include "orchestrator/process_executor.hpp"

#include <cerrno>
#include <utility>

#include <QDir>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>
#include <QTimer>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "orchestrator/path_utils.hpp"

#ifdef Q_OS_UNIX
#include <signal.h>
#include <unistd.h>
#endif

namespace tunelog {

namespace {

const QString kComponent = QStringLiteral("ProcessExecutor");

// Splits a byte stream into lines as it arrives.
class LineForwarder {
public:
    LineForwarder(logging::Logger &logger, QString event, QString label, bool warn)
        : m_logger(logger)
        , m_event(std::move(event))
        , m_label(std::move(label))
        , m_warn(warn)
    {
    }

    void feed(const QByteArray &bytes)
    {
        m_buffer.append(bytes);
        int newline = m_buffer.indexOf('\n');
        while (newline >= 0) {
            emitLine(m_buffer.left(newline));
            m_buffer.remove(0, newline + 1);
            newline = m_buffer.indexOf('\n');
        }
    }

    void flush()
    {
        if (!m_buffer.isEmpty()) {
            emitLine(m_buffer);
            m_buffer.clear();
        }
    }

    int lines() const { return m_lines; }

private:
    void emitLine(QByteArray line)
    {
        if (line.endsWith('\r')) {
            line.chop(1);
        }
        ++m_lines;
        const nlohmann::json context{{"unit", m_label.toStdString()},
                                     {"line", QString::fromUtf8(line).toStdString()}};
        if (m_warn) {
            TLOG_WARN(m_logger, kComponent, QStringLiteral("run"), m_event,
                      QStringLiteral("unit_output"), QStringLiteral("stderr_pipe"), context);
        } else {
            TLOG_INFO(m_logger, kComponent, QStringLiteral("run"), m_event,
                      QStringLiteral("unit_output"), QStringLiteral("stdout_pipe"), context);
        }
    }

    logging::Logger &m_logger;
    QString m_event;
    QString m_label;
    bool m_warn = false;
    QByteArray m_buffer;
    int m_lines = 0;
};

QString resolveExecutable(const QString &candidate)
{
    if (candidate.isEmpty()) {
        return QString();
    }
    const QFileInfo info(candidate);
    if (info.isAbsolute() || candidate.contains(QLatin1Char('/'))
        || candidate.contains(QLatin1Char('\\'))) {
        return info.exists() && info.isFile() ? info.absoluteFilePath() : QString();
    }
    return QStandardPaths::findExecutable(candidate);
}

QString workspacePath(const QString &path, const QString &workspaceRoot)
{
    if (path.isEmpty() || QFileInfo(path).isAbsolute()) {
        return path;
    }
    return QDir(workspaceRoot).absoluteFilePath(path);
}

} // namespace

ProcessExecutor::ProcessExecutor(logging::Logger &logger, Options options)
    : m_logger(logger)
    , m_options(std::move(options))
{
}

QString ProcessExecutor::resolvePowerShell() const
{
    const QString configured = resolveExecutable(m_options.powershellPath);
    if (!configured.isEmpty()) {
        return configured;
    }
    if (!m_options.powershellPath.isEmpty()) {
        TLOG_WARN(m_logger,
                  kComponent,
                  QStringLiteral("resolvePowerShell"),
                  QStringLiteral("configured_interpreter_missing"),
                  QStringLiteral("config_path_not_found"),
                  QStringLiteral("fallback_path_search"),
                  (nlohmann::json{{"powershellPath", m_options.powershellPath.toStdString()}}));
    }
    for (const QString &name : {QStringLiteral("pwsh"), QStringLiteral("powershell")}) {
        const QString found = QStandardPaths::findExecutable(name);
        if (!found.isEmpty()) {
            return found;
        }
    }
    return QString();
}

QString ProcessExecutor::resolveNativeProgram(const QString &program,
                                              const QString &workspaceRoot) const
{
    if (program.isEmpty()) {
        return QString();
    }

    QStringList names = {program};
#ifdef Q_OS_WIN
    if (!program.endsWith(QStringLiteral(".exe"), Qt::CaseInsensitive)) {
        names.append(program + QStringLiteral(".exe"));
    }
#endif
    for (const QString &name : names) {
        const QFileInfo info(workspacePath(name, workspaceRoot));
        if (info.exists() && info.isFile() && info.isExecutable()) {
            return info.absoluteFilePath();
        }
    }

    if (!QFileInfo(program).isAbsolute()) {
        const QString sibling = findSiblingBinary(QFileInfo(program).fileName());
        if (!sibling.isEmpty()) {
            return sibling;
        }
        return QStandardPaths::findExecutable(program);
    }
    return QString();
}

QStringList ProcessExecutor::buildArguments(RunnerKind runner,
                                            const QString &scriptOrProfile,
                                            const std::vector<std::string> &extraArgs,
                                            const UnitInvocation &invocation)
{
    const QString mode = QString::fromStdString(toModeString(invocation.mode));
    const QString runId = QString::fromStdString(invocation.runId);
    QStringList args;

    if (runner == RunnerKind::PowerShell) {
        args << QStringLiteral("-NoLogo") << QStringLiteral("-NoProfile")
             << QStringLiteral("-ExecutionPolicy") << QStringLiteral("Bypass")
             << QStringLiteral("-File") << normalizeArgument(scriptOrProfile)
             << QStringLiteral("-Mode") << mode
             << QStringLiteral("-RunId") << runId
             << QStringLiteral("-WorkspaceRoot") << normalizeArgument(invocation.workspaceRoot)
             << QStringLiteral("-LogFile") << normalizeArgument(invocation.logFile)
             << QStringLiteral("-ContextJson") << normalizeArgument(invocation.contextFile);
        if (!invocation.targetContextFile.isEmpty()) {
            args << QStringLiteral("-TargetContextJson")
                 << normalizeArgument(invocation.targetContextFile);
        }
    } else {
        args << QStringLiteral("--mode") << mode
             << QStringLiteral("--run-id") << runId
             << QStringLiteral("--workspace-root") << normalizeArgument(invocation.workspaceRoot)
             << QStringLiteral("--log-file") << normalizeArgument(invocation.logFile)
             << QStringLiteral("--context-file") << normalizeArgument(invocation.contextFile);
        if (!invocation.targetContextFile.isEmpty()) {
            args << QStringLiteral("--target-context-file")
                 << normalizeArgument(invocation.targetContextFile);
        }
        if (!scriptOrProfile.isEmpty()) {
            args << QStringLiteral("--profile") << normalizeArgument(scriptOrProfile);
        }
    }

    for (const std::string &extra : extraArgs) {
        args << normalizeArgument(QString::fromStdString(extra));
    }

    for (const auto &[flag, enabled] : invocation.optIns) {
        const QString value = enabled ? QStringLiteral("true") : QStringLiteral("false");
        if (runner == RunnerKind::PowerShell) {
            args << QStringLiteral("-") + QString::fromStdString(flag) << value;
        } else {
            args << QStringLiteral("--opt-in")
                 << QString::fromStdString(flag) + QLatin1Char('=') + value;
        }
    }
    return args;
}

ExecutionResult ProcessExecutor::runPhase(const PhaseSpec &phase,
                                          const UnitInvocation &invocation,
                                          int timeoutMs)
{
    const QString label = QString::fromStdString(phase.name);
    QString program;
    QString scriptOrProfile;

    if (phase.runner == RunnerKind::PowerShell) {
        program = resolvePowerShell();
        scriptOrProfile = workspacePath(QString::fromStdString(phase.program),
                                        invocation.workspaceRoot);
    } else {
        program = resolveNativeProgram(QString::fromStdString(phase.program),
                                       invocation.workspaceRoot);
        scriptOrProfile = workspacePath(QString::fromStdString(phase.profile),
                                        invocation.workspaceRoot);
    }

    if (program.isEmpty()) {
        ExecutionResult result;
        result.exitCode = kExitUnitNotFound;
        result.program = QString::fromStdString(phase.program);
        result.errorMessage = phase.runner == RunnerKind::PowerShell
            ? QStringLiteral("No PowerShell found (pwsh/powershell)")
            : QStringLiteral("Unit program not found: %1").arg(result.program);
        TLOG_ERROR(m_logger,
                   kComponent,
                   QStringLiteral("runPhase"),
                   QStringLiteral("unit_not_found"),
                   QStringLiteral("interpreter_resolution_failed"),
                   QStringLiteral("path_search"),
                   (nlohmann::json{{"phase", phase.name},
                                   {"program", phase.program},
                                   {"error", result.errorMessage.toStdString()}}));
        return result;
    }

    const QStringList args = buildArguments(phase.runner, scriptOrProfile, phase.args, invocation);
    return run(program, args, timeoutMs, label);
}

ExecutionResult ProcessExecutor::run(const QString &program,
                                     const QStringList &arguments,
                                     int timeoutMs,
                                     const QString &label)
{
    ExecutionResult result;
    result.program = program;
    result.arguments = arguments;

    const QString unitLabel = label.isEmpty() ? QFileInfo(program).fileName() : label;
    LineForwarder out(m_logger, QStringLiteral("unit_stdout"), unitLabel, false);
    LineForwarder err(m_logger, QStringLiteral("unit_stderr"), unitLabel, true);

    QProcess process;
    process.setProgram(program);
    process.setArguments(arguments);
    process.setProcessChannelMode(QProcess::SeparateChannels);
#ifdef Q_OS_UNIX
    // Own process group so a timeout can take down grandchildren too.
    process.setChildProcessModifier([] { ::setpgid(0, 0); });
#endif

    TLOG_INFO(m_logger,
              kComponent,
              QStringLiteral("run"),
              QStringLiteral("unit_starting"),
              QStringLiteral("phase_execution"),
              QStringLiteral("qprocess"),
              (nlohmann::json{{"unit", unitLabel.toStdString()},
                              {"program", program.toStdString()},
                              {"args", arguments.join(QLatin1Char(' ')).toStdString()},
                              {"timeoutMs", timeoutMs}}));

    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    QTimer grace;
    grace.setSingleShot(true);
    bool finished = false;

    QObject::connect(&process, &QProcess::readyReadStandardOutput, &loop, [&] {
        out.feed(process.readAllStandardOutput());
    });
    QObject::connect(&process, &QProcess::readyReadStandardError, &loop, [&] {
        err.feed(process.readAllStandardError());
    });
    QObject::connect(&process, &QProcess::finished, &loop, [&](int, QProcess::ExitStatus) {
        finished = true;
        loop.quit();
    });
    // After a forced kill the pipes get a bounded window to report the exit.
    QObject::connect(&grace, &QTimer::timeout, &loop, [&] {
        result.readersFinished = false;
        loop.quit();
    });
    QObject::connect(&timeout, &QTimer::timeout, &loop, [&] {
        result.timedOut = true;
        killProcessTree(process.processId());
        process.kill();
        grace.start(m_options.readerGraceMs);
    });

    QElapsedTimer clock;
    clock.start();
    process.start();
    if (!process.waitForStarted()) {
        result.exitCode = kExitUnitNotFound;
        result.errorMessage = process.errorString();
        result.duration = std::chrono::milliseconds(clock.elapsed());
        TLOG_ERROR(m_logger,
                   kComponent,
                   QStringLiteral("run"),
                   QStringLiteral("unit_start_failed"),
                   QStringLiteral("process_spawn_failed"),
                   QStringLiteral("qprocess"),
                   (nlohmann::json{{"unit", unitLabel.toStdString()},
                                   {"program", program.toStdString()},
                                   {"error", result.errorMessage.toStdString()}}));
        return result;
    }
    result.started = true;
    process.closeWriteChannel();

    if (timeoutMs > 0) {
        timeout.start(timeoutMs);
    }
    if (!finished) {
        loop.exec();
    }
    timeout.stop();
    grace.stop();

    out.feed(process.readAllStandardOutput());
    err.feed(process.readAllStandardError());
    out.flush();
    err.flush();
    result.stdoutLines = out.lines();
    result.stderrLines = err.lines();
    result.duration = std::chrono::milliseconds(clock.elapsed());

    if (!result.readersFinished) {
        TLOG_WARN(m_logger,
                  kComponent,
                  QStringLiteral("run"),
                  QStringLiteral("reader_unfinished"),
                  QStringLiteral("grace_period_expired"),
                  QStringLiteral("pipe_drain"),
                  (nlohmann::json{{"unit", unitLabel.toStdString()},
                                  {"graceMs", m_options.readerGraceMs}}));
    }

    if (result.timedOut) {
        result.exitCode = kExitTimedOut;
        result.errorMessage = QStringLiteral("Timed out after %1 ms").arg(timeoutMs);
        TLOG_ERROR(m_logger,
                   kComponent,
                   QStringLiteral("run"),
                   QStringLiteral("unit_timed_out"),
                   QStringLiteral("timeout_expired"),
                   QStringLiteral("process_tree_killed"),
                   (nlohmann::json{{"unit", unitLabel.toStdString()},
                                   {"timeoutMs", timeoutMs},
                                   {"elapsedMs", result.duration.count()}}));
        return result;
    }

    if (process.exitStatus() == QProcess::CrashExit) {
        result.crashed = true;
        result.exitCode = -1;
        result.errorMessage = process.errorString();
    } else {
        result.exitCode = process.exitCode();
    }

    const nlohmann::json context{{"unit", unitLabel.toStdString()},
                                 {"exitCode", result.exitCode},
                                 {"crashed", result.crashed},
                                 {"durationMs", result.duration.count()},
                                 {"stdoutLines", result.stdoutLines},
                                 {"stderrLines", result.stderrLines}};
    if (result.succeeded()) {
        TLOG_INFO(m_logger, kComponent, QStringLiteral("run"), QStringLiteral("unit_finished"),
                  QStringLiteral("phase_execution"), QStringLiteral("qprocess"), context);
    } else {
        TLOG_WARN(m_logger, kComponent, QStringLiteral("run"), QStringLiteral("unit_failed"),
                  QStringLiteral("non_zero_exit"), QStringLiteral("qprocess"), context);
    }
    return result;
}

void ProcessExecutor::killProcessTree(qint64 pid)
{
    if (pid <= 0) {
        return;
    }
#ifdef Q_OS_WIN
    const CommandOutput output = runCommand(
        QStringLiteral("taskkill"),
        {QStringLiteral("/PID"), QString::number(pid), QStringLiteral("/T"), QStringLiteral("/F")},
        10000);
    if (output.exitCode != 0) {
        TLOG_WARN(m_logger,
                  kComponent,
                  QStringLiteral("killProcessTree"),
                  QStringLiteral("taskkill_failed"),
                  QStringLiteral("timeout_expired"),
                  QStringLiteral("taskkill"),
                  (nlohmann::json{{"pid", pid},
                                  {"exitCode", output.exitCode},
                                  {"stderr", output.standardError.toStdString()}}));
    }
#else
    if (::kill(-static_cast<pid_t>(pid), SIGKILL) != 0) {
        TLOG_WARN(m_logger,
                  kComponent,
                  QStringLiteral("killProcessTree"),
                  QStringLiteral("group_kill_failed"),
                  QStringLiteral("timeout_expired"),
                  QStringLiteral("kill_process_group"),
                  (nlohmann::json{{"pid", pid}, {"errno", errno}}));
    }
#endif
}

} // namespace tunelog
