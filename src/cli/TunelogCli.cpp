#include "cli/TunelogCli.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <vector>

#include <QDir>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "journal/run_context.hpp"
#include "journal/run_index.hpp"
#include "orchestrator/path_utils.hpp"
#include "orchestrator/phase_orchestrator.hpp"
#include "orchestrator/process_executor.hpp"

namespace tunelog {

namespace {

const QString kComponent = QStringLiteral("TunelogCli");
constexpr int kRollbackCandidates = 5;

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  tunelog                                   interactive menu\n"
        "  tunelog apply [--yes] [--enable FLAG]... [--workspace DIR] [--trace]\n"
        "  tunelog rollback --target PATH [--workspace DIR] [--trace]\n"
        "  tunelog list-runs [--limit N] [--workspace DIR]\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QStringList getArgValues(const QStringList &args, const QString &key)
{
    QStringList values;
    for (int i = 0; i + 1 < args.size(); ++i) {
        if (args.at(i) == key) {
            values.push_back(args.at(i + 1));
        }
    }
    return values;
}

QString resolveTarget(const QString &target, const QString &workspaceRoot)
{
    if (target.isEmpty() || QFileInfo(target).isAbsolute()) {
        return target;
    }
    if (QFileInfo::exists(target)) {
        return QFileInfo(target).absoluteFilePath();
    }
    return QDir(workspaceRoot).absoluteFilePath(target);
}

std::string statusFor(const PipelineResult &result)
{
    if (result.cancelled) {
        return "cancelled";
    }
    return result.succeeded ? "succeeded" : "failed";
}

void printRuns(const std::vector<RunRecord> &runs)
{
    if (runs.empty()) {
        std::cout << "No runs recorded.\n";
        return;
    }
    for (std::size_t i = 0; i < runs.size(); ++i) {
        const RunRecord &run = runs[i];
        std::cout << "  " << (i + 1) << ") " << run.runId << "  " << toModeString(run.mode)
                  << "  " << run.status << "  " << run.changeCount << " changes\n"
                  << "     " << run.contextFile << "\n";
    }
}

} // namespace

int TunelogCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2 || args.at(1).startsWith(QStringLiteral("--"))) {
        m_interactive = true;
        return runMenu(args);
    }

    const QString command = args.at(1);
    if (command == QStringLiteral("apply")) {
        return runApply(args);
    }
    if (command == QStringLiteral("rollback")) {
        return runRollback(args, getArgValue(args, QStringLiteral("--target")));
    }
    if (command == QStringLiteral("list-runs")) {
        return runListRuns(args);
    }

    std::cerr << usageText().toStdString();
    return kCliExitFailed;
}

AppConfig TunelogCli::loadConfig(const QStringList &args) const
{
    std::string error;
    AppConfig config = loadAppConfig(getArgValue(args, QStringLiteral("--workspace")), &error);
    if (!error.empty()) {
        std::cerr << "Config ignored: " << error << "\n";
    }
    if (args.contains(QStringLiteral("--trace"))) {
        config.trace = true;
    }
    return config;
}

bool TunelogCli::askYesNo(const std::string &question, bool defaultAnswer) const
{
    std::cout << question << (defaultAnswer ? " [Y/n] " : " [y/N] ") << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return defaultAnswer;
    }
    const QString trimmed = QString::fromStdString(answer).trimmed().toLower();
    if (trimmed.isEmpty()) {
        return defaultAnswer;
    }
    return trimmed == QStringLiteral("y") || trimmed == QStringLiteral("yes");
}

int TunelogCli::runMenu(const QStringList &args)
{
    std::cout << "tunelog\n"
              << "  1) Apply\n"
              << "  2) Rollback (select a previous run context)\n"
              << "  3) Exit\n"
              << "Select: " << std::flush;

    std::string choice;
    if (!std::getline(std::cin, choice)) {
        return kCliExitOk;
    }
    const QString selected = QString::fromStdString(choice).trimmed();
    if (selected == QStringLiteral("1")) {
        return runApply(args);
    }
    if (selected == QStringLiteral("2")) {
        return runRollback(args, QString());
    }
    return kCliExitOk;
}

int TunelogCli::runApply(const QStringList &args)
{
    std::map<std::string, bool> optIns;
    for (const QString &flag : getArgValues(args, QStringLiteral("--enable"))) {
        optIns[flag.toStdString()] = true;
    }
    const bool assumeYes = args.contains(QStringLiteral("--yes"));
    return runPipeline(RunMode::Apply, args, QString(), assumeYes, optIns);
}

QString TunelogCli::promptForTarget(const AppConfig &config) const
{
    std::vector<RunRecord> candidates;
    try {
        RunIndex index(RunIndex::defaultPath(config.workspaceRoot.toStdString()));
        candidates = index.listRuns(RunMode::Apply, kRollbackCandidates);
    } catch (const std::exception &ex) {
        std::cerr << "Run index unavailable: " << ex.what() << "\n";
    }

    std::cout << "Recent apply runs:\n";
    printRuns(candidates);
    std::cout << "Number, or path to context json (default: "
              << (candidates.empty() ? std::string("none") : candidates.front().contextFile)
              << "): " << std::flush;

    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return QString();
    }
    const QString trimmed = QString::fromStdString(answer).trimmed();
    if (trimmed.isEmpty()) {
        return candidates.empty() ? QString()
                                  : QString::fromStdString(candidates.front().contextFile);
    }
    bool isNumber = false;
    const int number = trimmed.toInt(&isNumber);
    if (isNumber && number >= 1 && number <= static_cast<int>(candidates.size())) {
        return QString::fromStdString(candidates[static_cast<std::size_t>(number - 1)].contextFile);
    }
    return trimmed;
}

int TunelogCli::runRollback(const QStringList &args, QString target)
{
    if (target.isEmpty() && m_interactive) {
        const auto config = loadConfig(args);
        target = promptForTarget(config);
    }
    return runPipeline(RunMode::Rollback, args, target, true, {});
}

int TunelogCli::runListRuns(const QStringList &args)
{
    const auto config = loadConfig(args);
    const int limit = getArgValue(args, QStringLiteral("--limit")).toInt();
    try {
        RunIndex index(RunIndex::defaultPath(config.workspaceRoot.toStdString()));
        printRuns(index.listRuns(std::nullopt, limit));
    } catch (const std::exception &ex) {
        std::cerr << "Run index unavailable: " << ex.what() << "\n";
        return kCliExitFailed;
    }
    return kCliExitOk;
}

int TunelogCli::runPipeline(RunMode mode,
                            const QStringList &args,
                            const QString &target,
                            bool assumeYes,
                            const std::map<std::string, bool> &presetOptIns)
{
    const auto config = loadConfig(args);

    RunContext context = RunContext::create(RunContext::generateRunId(), config.workspaceRoot, mode);
    logging::Logger logger(QStringLiteral("tunelog"), context.logFile(), config.trace, true);
    logger.setCorrelationId(QString::fromStdString(context.runId()));

    TLOG_INFO(logger,
              kComponent,
              QStringLiteral("runPipeline"),
              QStringLiteral("run_started"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              (nlohmann::json{{"mode", toModeString(mode)},
                              {"runId", context.runId()},
                              {"workspaceRoot", config.workspaceRoot.toStdString()},
                              {"config", appConfigToJson(config)}}));

    if (config.requireElevation && !isElevated()) {
        TLOG_ERROR(logger,
                   kComponent,
                   QStringLiteral("runPipeline"),
                   QStringLiteral("not_elevated"),
                   QStringLiteral("admin_required"),
                   QStringLiteral("elevation_check"),
                   nlohmann::json::object());
        std::cerr << "Run tunelog as administrator (root).\n";
        return kCliExitNotElevated;
    }

    if (const auto sync = findSyncFolder(config.workspaceRoot)) {
        TLOG_WARN(logger,
                  kComponent,
                  QStringLiteral("runPipeline"),
                  QStringLiteral("workspace_in_sync_folder"),
                  QStringLiteral("file_locking_risk"),
                  QStringLiteral("path_scan"),
                  (nlohmann::json{{"provider", sync->provider.toStdString()},
                                  {"syncRoot", sync->root.toStdString()},
                                  {"recommendation", "move the workspace to a local directory"}}));
    }

    if (mode == RunMode::Rollback) {
        const QString absTarget = resolveTarget(target, config.workspaceRoot);
        const ContextLoadResult loaded = absTarget.isEmpty()
            ? ContextLoadResult{std::nullopt, "no rollback target given"}
            : RunContext::load(absTarget);
        if (!loaded.context.has_value()) {
            TLOG_ERROR(logger,
                       kComponent,
                       QStringLiteral("runPipeline"),
                       QStringLiteral("rollback_target_missing"),
                       QString::fromStdString(loaded.reason),
                       QStringLiteral("run_context_load"),
                       (nlohmann::json{{"target", absTarget.toStdString()}}));
            std::cerr << "Rollback target unusable: " << loaded.reason << "\n";
            return kCliExitRollbackTargetMissing;
        }
        context.setRollbackTarget(absTarget);
        context.data()["rollbackTarget"] = absTarget.toStdString();
        context.data()["rollbackTargetRunId"] = loaded.context->runId();
        TLOG_WARN(logger,
                  kComponent,
                  QStringLiteral("runPipeline"),
                  QStringLiteral("rollback_mode"),
                  QStringLiteral("user_request"),
                  QStringLiteral("revert_recorded_changes"),
                  (nlohmann::json{{"target", absTarget.toStdString()},
                                  {"changes", loaded.context->journal().size()}}));
    }

    std::unique_ptr<RunIndex> index;
    RunRecord record;
    record.runId = context.runId();
    record.mode = mode;
    record.startedAt = context.createdAt();
    record.finishedAt = context.createdAt();
    record.status = "running";
    record.contextFile = context.contextFile().toStdString();
    record.logFile = context.logFile().toStdString();
    record.rollbackTarget = context.rollbackTarget().toStdString();
    try {
        index = std::make_unique<RunIndex>(
            RunIndex::defaultPath(config.workspaceRoot.toStdString()));
        index->upsertRun(record);
    } catch (const std::exception &ex) {
        index.reset();
        TLOG_WARN(logger,
                  kComponent,
                  QStringLiteral("runPipeline"),
                  QStringLiteral("run_index_unavailable"),
                  QStringLiteral("sqlite_error"),
                  QStringLiteral("continue_without_index"),
                  (nlohmann::json{{"error", ex.what()}}));
    }

    ProcessExecutor executor(logger, {config.powershellPath, config.readerGraceMs});
    PhaseOrchestrator orchestrator(executor, context, logger, config.defaultTimeoutMs);
    orchestrator.setOptInValues(presetOptIns);

    int position = 0;
    OrchestratorHooks hooks;
    hooks.confirm = [&](const PhaseSpec &phase) {
        return assumeYes || askYesNo(phase.confirm, true);
    };
    hooks.optIn = [&](const PhaseSpec &, const OptInSpec &optIn) {
        if (assumeYes && !m_interactive) {
            return false;
        }
        return askYesNo(optIn.prompt.empty() ? "Enable " + optIn.flag + "?" : optIn.prompt, false);
    };
    hooks.phaseFinished = [&](const PhaseSpec &, const PhaseResult &result) {
        if (!index) {
            return;
        }
        try {
            index->addPhaseResult(record.runId, position++, result);
        } catch (const std::exception &ex) {
            TLOG_WARN(logger, kComponent, QStringLiteral("runPipeline"),
                      QStringLiteral("run_index_write_failed"), QStringLiteral("sqlite_error"),
                      QStringLiteral("continue_without_index"), (nlohmann::json{{"error", ex.what()}}));
        }
    };
    orchestrator.setHooks(hooks);

    const std::vector<PhaseSpec> &phases =
        mode == RunMode::Apply ? config.applyPipeline : config.rollbackPipeline;
    const PipelineResult result = orchestrator.run(phases);

    record.finishedAt = std::chrono::system_clock::now();
    record.status = statusFor(result);
    record.changeCount = static_cast<int>(context.journal().size());
    if (index) {
        try {
            index->upsertRun(record);
        } catch (const std::exception &ex) {
            TLOG_WARN(logger, kComponent, QStringLiteral("runPipeline"),
                      QStringLiteral("run_index_write_failed"), QStringLiteral("sqlite_error"),
                      QStringLiteral("continue_without_index"), (nlohmann::json{{"error", ex.what()}}));
        }
    }

    std::cout << "\n" << toModeString(mode) << " " << record.status;
    if (!result.haltedAt.empty()) {
        std::cout << " at phase " << result.haltedAt;
    }
    std::cout << "\nLog file:     " << record.logFile
              << "\nContext file: " << record.contextFile << "\n";

    if (result.cancelled) {
        return kCliExitCancelled;
    }
    return result.succeeded ? kCliExitOk : kCliExitFailed;
}

} // namespace tunelog
