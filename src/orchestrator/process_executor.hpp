#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include <QString>
#include <QStringList>

#include "common/enums.hpp"
#include "common/models.hpp"

namespace tunelog::logging {
class Logger;
}

namespace tunelog {

inline constexpr int kExitTimedOut = 124;
inline constexpr int kExitUnitNotFound = 127;

// Everything a mutator unit is told about the run it belongs to.
struct UnitInvocation {
    RunMode mode = RunMode::Apply;
    std::string runId;
    QString workspaceRoot;
    QString logFile;
    QString contextFile;
    QString targetContextFile;
    // Flag name and its value, passed as true/false.
    std::vector<std::pair<std::string, bool>> optIns;
};

struct ExecutionResult {
    bool started = false;
    bool timedOut = false;
    bool crashed = false;
    int exitCode = -1;
    QString program;
    QStringList arguments;
    QString errorMessage;
    std::chrono::milliseconds duration{0};
    int stdoutLines = 0;
    int stderrLines = 0;
    bool readersFinished = true;

    bool succeeded() const { return started && !timedOut && !crashed && exitCode == 0; }
};

// Runs one phase to completion. ProcessExecutor is the real implementation;
// tests substitute their own.
class PhaseRunner {
public:
    virtual ~PhaseRunner() = default;
    virtual ExecutionResult runPhase(const PhaseSpec &phase,
                                     const UnitInvocation &invocation,
                                     int timeoutMs) = 0;
};

// Launches mutator units as child processes: interpreter resolution, argv
// construction, asynchronous output forwarding to the logger and a hard
// wall-clock timeout that kills the whole process tree.
class ProcessExecutor : public PhaseRunner {
public:
    struct Options {
        QString powershellPath;
        int readerGraceMs = 5000;
    };

    ProcessExecutor(logging::Logger &logger, Options options);

    // Configured path, then pwsh, then powershell. Empty when none exists.
    QString resolvePowerShell() const;
    // Absolute or workspace-relative path, then a sibling of the running
    // binary, then PATH. Empty when none exists.
    QString resolveNativeProgram(const QString &program, const QString &workspaceRoot) const;

    // Full argv after the program: fixed contract arguments, phase.args, then
    // the opt-in flags. scriptOrProfile is the already resolved script path
    // (PowerShell) or profile path (native, may be empty).
    static QStringList buildArguments(RunnerKind runner,
                                      const QString &scriptOrProfile,
                                      const std::vector<std::string> &extraArgs,
                                      const UnitInvocation &invocation);

    ExecutionResult runPhase(const PhaseSpec &phase,
                             const UnitInvocation &invocation,
                             int timeoutMs) override;

    // label tags the forwarded output lines.
    ExecutionResult run(const QString &program,
                        const QStringList &arguments,
                        int timeoutMs,
                        const QString &label = QString());

private:
    void killProcessTree(qint64 pid);

    logging::Logger &m_logger;
    Options m_options;
};

} // namespace tunelog
