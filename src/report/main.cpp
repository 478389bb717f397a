#include <vector>

#include <QCoreApplication>
#include <QDir>

#include "common/app_config.hpp"
#include "common/logging.hpp"
#include "report/ReportCli.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    bool trace = false;
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }

    const tunelog::AppConfig config = tunelog::loadAppConfig();
    QDir(config.workspaceRoot).mkpath(QStringLiteral("Logs"));
    tunelog::logging::Logger logger(
        QStringLiteral("tunelog-report"),
        QDir(config.workspaceRoot).absoluteFilePath(QStringLiteral("Logs/tunelog-report.log")),
        trace || config.trace);
    TLOG_INFO(logger,
              QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("report_cli_start"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              (nlohmann::json{{"args", filteredArgs.size()}}));

    // CLI entry point: delegate to ReportCli for argument parsing and output.
    tunelog::ReportCli cli(logger);
    std::vector<QByteArray> localArgs;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        localArgs.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
