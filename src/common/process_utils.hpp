#pragma once

#include <QString>
#include <QStringList>

namespace tunelog {

struct CommandOutput {
    bool started = false;
    bool timedOut = false;
    int exitCode = -1;
    QString standardOutput;
    QString standardError;
};

// Runs a short-lived system utility (sc, powercfg, bcdedit, systemctl) and
// collects its output. No shell is involved.
CommandOutput runCommand(const QString &program,
                         const QStringList &arguments,
                         int timeoutMs = 30000);

// Looks for a binary shipped next to the running executable.
QString findSiblingBinary(const QString &name);

// Administrator on Windows, root elsewhere.
bool isElevated();

} // namespace tunelog
