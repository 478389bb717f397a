#pragma once

#include <QString>
#include <QStringList>

namespace tunelog::logging {
class Logger;
}

namespace tunelog {

class ReportCli
{
public:
    explicit ReportCli(logging::Logger &logger);

    // CLI dispatcher for journal, run and integrity reports.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    // journal and verify read a context file; runs reads the SQLite index.
    int runJournalReport(const QStringList &args);
    int runRunsReport(const QStringList &args);
    int runVerifyReport(const QStringList &args);

    logging::Logger &m_logger;
};

} // namespace tunelog
