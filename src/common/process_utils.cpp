#include "common/process_utils.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QProcess>

#if defined(Q_OS_WIN)
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace tunelog {

CommandOutput runCommand(const QString &program,
                         const QStringList &arguments,
                         int timeoutMs)
{
    CommandOutput output;

    QProcess process;
    process.start(program, arguments);
    if (!process.waitForStarted()) {
        output.standardError = process.errorString();
        return output;
    }
    output.started = true;

    process.closeWriteChannel();

    if (!process.waitForFinished(timeoutMs)) {
        output.timedOut = true;
        process.kill();
        process.waitForFinished(1000);
        output.standardOutput = QString::fromLocal8Bit(process.readAllStandardOutput());
        output.standardError = QString::fromLocal8Bit(process.readAllStandardError());
        return output;
    }

    output.standardOutput = QString::fromLocal8Bit(process.readAllStandardOutput());
    output.standardError = QString::fromLocal8Bit(process.readAllStandardError());
    if (process.exitStatus() != QProcess::NormalExit) {
        output.exitCode = -1;
        return output;
    }
    output.exitCode = process.exitCode();
    return output;
}

QString findSiblingBinary(const QString &name)
{
    if (!QCoreApplication::instance()) {
        return QString();
    }

    const QString appDir = QCoreApplication::applicationDirPath();
    const QStringList relCandidates = {
        QStringLiteral("."),
        QStringLiteral(".."),
        QStringLiteral("../bin"),
        QStringLiteral("../src/unit"),
    };

    QStringList names = {name};
#if defined(Q_OS_WIN)
    if (!name.endsWith(QStringLiteral(".exe"), Qt::CaseInsensitive)) {
        names.prepend(name + QStringLiteral(".exe"));
    }
#endif

    for (const QString &relPath : relCandidates) {
        for (const QString &candidateName : names) {
            const QString candidate =
                QDir(appDir).absoluteFilePath(relPath + QDir::separator() + candidateName);
            QFileInfo info(candidate);
            if (info.exists() && info.isFile() && info.isExecutable()) {
                return info.absoluteFilePath();
            }
        }
    }
    return QString();
}

bool isElevated()
{
#if defined(Q_OS_WIN)
    BOOL isAdmin = FALSE;
    SID_IDENTIFIER_AUTHORITY ntAuthority = SECURITY_NT_AUTHORITY;
    PSID adminGroup = nullptr;
    if (AllocateAndInitializeSid(&ntAuthority, 2, SECURITY_BUILTIN_DOMAIN_RID,
                                 DOMAIN_ALIAS_RID_ADMINS, 0, 0, 0, 0, 0, 0,
                                 &adminGroup)) {
        if (!CheckTokenMembership(nullptr, adminGroup, &isAdmin)) {
            isAdmin = FALSE;
        }
        FreeSid(adminGroup);
    }
    return isAdmin == TRUE;
#else
    return geteuid() == 0;
#endif
}

} // namespace tunelog
