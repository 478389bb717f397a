#include <exception>
#include <iostream>
#include <map>
#include <string>
#include <utility>

#include <QCommandLineParser>
#include <QCoreApplication>

#include "common/app_config.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "platform/backend_factory.hpp"
#include "unit/phase_profile.hpp"
#include "unit/unit_runner.hpp"

#include <nlohmann/json.hpp>

namespace {

bool parseOptIn(const QString &text, std::map<std::string, bool> &optIns)
{
    const int eq = text.indexOf(QLatin1Char('='));
    if (eq <= 0) {
        return false;
    }
    const QString value = text.mid(eq + 1).trimmed().toLower();
    if (value != QStringLiteral("true") && value != QStringLiteral("false")) {
        return false;
    }
    optIns[text.left(eq).trimmed().toStdString()] = value == QStringLiteral("true");
    return true;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("tunelog-unit"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Runs one tunelog phase profile."));
    parser.addHelpOption();
    QCommandLineOption modeOption(QStringList() << "mode", "Apply or Rollback.", "mode");
    QCommandLineOption runIdOption(QStringList() << "run-id", "Run identifier.", "id");
    QCommandLineOption workspaceOption(QStringList() << "workspace-root", "Workspace root.", "path");
    QCommandLineOption logFileOption(QStringList() << "log-file", "Run log file.", "path");
    QCommandLineOption contextOption(QStringList() << "context-file", "Run context file.", "path");
    QCommandLineOption targetOption(QStringList() << "target-context-file",
                                    "Context file to roll back.", "path");
    QCommandLineOption profileOption(QStringList() << "profile", "Phase profile JSON.", "path");
    QCommandLineOption optInOption(QStringList() << "opt-in",
                                   "Opt-in flag as Flag=true|false; repeatable.", "flag");
    QCommandLineOption traceOption(QStringList() << "trace", "Enable trace logging.");
    parser.addOption(modeOption);
    parser.addOption(runIdOption);
    parser.addOption(workspaceOption);
    parser.addOption(logFileOption);
    parser.addOption(contextOption);
    parser.addOption(targetOption);
    parser.addOption(profileOption);
    parser.addOption(optInOption);
    parser.addOption(traceOption);
    parser.process(app);

    const auto mode = tunelog::parseModeString(parser.value(modeOption).toStdString());
    if (!mode.has_value() || !parser.isSet(runIdOption) || !parser.isSet(workspaceOption)
        || !parser.isSet(contextOption) || !parser.isSet(profileOption)) {
        std::cerr << "tunelog-unit: --mode, --run-id, --workspace-root, --context-file and "
                     "--profile are required\n";
        return tunelog::kUnitExitUsage;
    }

    tunelog::UnitOptions options;
    options.mode = *mode;
    options.runId = parser.value(runIdOption).toStdString();
    options.workspaceRoot = parser.value(workspaceOption);
    options.logFile = parser.value(logFileOption);
    options.contextFile = parser.value(contextOption);
    options.targetContextFile = parser.value(targetOption);
    options.profilePath = parser.value(profileOption);
    for (const QString &optIn : parser.values(optInOption)) {
        if (!parseOptIn(optIn, options.optIns)) {
            std::cerr << "tunelog-unit: bad --opt-in value " << optIn.toStdString() << "\n";
            return tunelog::kUnitExitUsage;
        }
    }

    std::string configError;
    const tunelog::AppConfig config = tunelog::loadAppConfig(options.workspaceRoot, &configError);
    tunelog::logging::Logger logger(QStringLiteral("tunelog-unit"),
                                    options.logFile,
                                    parser.isSet(traceOption) || config.trace);
    logger.setCorrelationId(QString::fromStdString(options.runId));
    if (!configError.empty()) {
        TLOG_WARN(logger,
                  QStringLiteral("main"),
                  QStringLiteral("main"),
                  QStringLiteral("config_ignored"),
                  QString::fromStdString(configError),
                  QStringLiteral("builtin_defaults"),
                  nlohmann::json::object());
    }

    try {
        tunelog::PhaseProfile profile = tunelog::loadPhaseProfile(options.profilePath);
        tunelog::Backends backends = tunelog::makeBackends(config, logger);
        tunelog::UnitRunner runner(options, std::move(profile), backends, logger);
        return runner.run();
    } catch (const std::exception &ex) {
        TLOG_ERROR(logger,
                   QStringLiteral("main"),
                   QStringLiteral("main"),
                   QStringLiteral("unit_aborted"),
                   QString::fromUtf8(ex.what()),
                   QStringLiteral("exception"),
                   (nlohmann::json{{"profile", options.profilePath.toStdString()}}));
        std::cerr << "tunelog-unit: " << ex.what() << "\n";
        return tunelog::kUnitExitFailure;
    }
}
