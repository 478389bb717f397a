#pragma once

#include <map>
#include <string>

#include <QString>
#include <QStringList>

#include "common/app_config.hpp"
#include "common/models.hpp"

namespace tunelog {

inline constexpr int kCliExitOk = 0;
inline constexpr int kCliExitFailed = 1;
inline constexpr int kCliExitRollbackTargetMissing = 2;
inline constexpr int kCliExitCancelled = 3;
inline constexpr int kCliExitNotElevated = 5;

class TunelogCli
{
public:
    // Menu when called without a command; apply, rollback and list-runs
    // otherwise. Prompts read std::cin, output goes to std::cout.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    int runMenu(const QStringList &args);
    int runApply(const QStringList &args);
    int runRollback(const QStringList &args, QString target);
    int runListRuns(const QStringList &args);

    // Shared by apply and rollback once the inputs are settled.
    int runPipeline(RunMode mode,
                    const QStringList &args,
                    const QString &target,
                    bool assumeYes,
                    const std::map<std::string, bool> &presetOptIns);

    AppConfig loadConfig(const QStringList &args) const;
    QString promptForTarget(const AppConfig &config) const;
    bool askYesNo(const std::string &question, bool defaultAnswer) const;

    bool m_interactive = false;
};

} // namespace tunelog
