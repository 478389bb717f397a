#include "report/ReportCli.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <optional>
#include <vector>

#include <QDateTime>

#include "common/app_config.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"
#include "journal/run_context.hpp"
#include "journal/run_index.hpp"

namespace tunelog {

namespace {

const QString kComponent = QStringLiteral("ReportCli");

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  tunelog-report journal --context PATH [--category C] [--key-prefix P] [--latest]"
        " [--format markdown|json]\n"
        "  tunelog-report runs [--workspace DIR] [--mode apply|rollback] [--limit N]"
        " [--format markdown|json]\n"
        "  tunelog-report verify --context PATH [--format markdown|json]\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString format = getArgValue(args, QStringLiteral("--format"));
    if (format.isEmpty()) {
        return QStringLiteral("markdown");
    }
    return format;
}

bool validFormat(const QString &format)
{
    if (format == QStringLiteral("markdown") || format == QStringLiteral("json")) {
        return true;
    }
    std::cerr << "Invalid format. Use markdown or json." << std::endl;
    return false;
}

std::string formatLocalTime(std::chrono::system_clock::time_point timestamp)
{
    QDateTime dt = QDateTime::fromMSecsSinceEpoch(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            timestamp.time_since_epoch())
            .count(),
        Qt::UTC);
    dt = dt.toLocalTime();
    return dt.toString("yyyy-MM-dd HH:mm:ss").toStdString();
}

void renderJournalMarkdown(const RunContext &context,
                           const std::vector<ChangeEntry> &entries,
                           bool latestOnly)
{
    std::cout << "# tunelog Change Journal\n\n";
    std::cout << "Run: " << context.runId() << " (" << toModeString(context.mode()) << ")\n";
    std::cout << "Created: " << toIso8601Utc(context.createdAt()) << "\n";
    std::cout << "Integrity: " << (context.integrityVerified() ? "verified" : "unverified")
              << "\n";
    std::cout << (latestOnly ? "Keys: " : "Entries: ") << entries.size() << "\n\n";
    std::cout << "## Changes\n\n";

    if (entries.empty()) {
        std::cout << "No recorded changes.\n";
        return;
    }

    for (const auto &entry : entries) {
        std::cout << "- [" << formatLocalTime(entry.timestamp) << "] (" << entry.category
                  << ") " << entry.key << ": " << entry.before.display() << " -> "
                  << entry.after.display() << "\n";
        if (!entry.note.empty()) {
            std::cout << "  - note: " << entry.note << "\n";
        }
    }
}

void renderJournalJson(const RunContext &context,
                       const std::vector<ChangeEntry> &entries,
                       bool latestOnly)
{
    nlohmann::json payload;
    payload["runId"] = context.runId();
    payload["mode"] = toModeString(context.mode());
    payload["createdAt"] = toIso8601Utc(context.createdAt());
    payload["integrityVerified"] = context.integrityVerified();
    payload["latestOnly"] = latestOnly;
    payload["totalEntries"] = entries.size();
    payload["changes"] = entries;

    std::cout << payload.dump(2) << std::endl;
}

void renderRunsMarkdown(const std::vector<RunRecord> &runs)
{
    std::cout << "# tunelog Runs\n\n";
    std::cout << "Total runs: " << runs.size() << "\n\n";

    if (runs.empty()) {
        std::cout << "No runs recorded.\n";
        return;
    }

    for (const auto &run : runs) {
        std::cout << "- [" << formatLocalTime(run.startedAt) << "] " << run.runId << " ("
                  << toModeString(run.mode) << ", " << run.status << ") " << run.changeCount
                  << " changes\n";
        std::cout << "  - context: " << run.contextFile << "\n";
        if (!run.rollbackTarget.empty()) {
            std::cout << "  - rollback of: " << run.rollbackTarget << "\n";
        }
    }
}

void renderRunsJson(const RunIndex &index, const std::vector<RunRecord> &runs)
{
    nlohmann::json payload;
    payload["totalRuns"] = runs.size();
    payload["runs"] = nlohmann::json::array();
    for (const auto &run : runs) {
        nlohmann::json item = run;
        item["phases"] = index.phaseResults(run.runId);
        payload["runs"].push_back(item);
    }

    std::cout << payload.dump(2) << std::endl;
}

} // namespace

ReportCli::ReportCli(logging::Logger &logger)
    : m_logger(logger)
{
}

int ReportCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    if (command == QStringLiteral("journal")) {
        return runJournalReport(args);
    }
    if (command == QStringLiteral("runs")) {
        return runRunsReport(args);
    }
    if (command == QStringLiteral("verify")) {
        return runVerifyReport(args);
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int ReportCli::runJournalReport(const QStringList &args)
{
    const QString contextPath = getArgValue(args, QStringLiteral("--context"));
    const QString format = getFormat(args);
    if (contextPath.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    if (!validFormat(format)) {
        return 1;
    }

    const ContextLoadResult loaded = RunContext::load(contextPath);
    if (!loaded.context.has_value()) {
        std::cerr << "Failed to load run context: " << loaded.reason << std::endl;
        return 1;
    }

    RollbackFilter filter;
    filter.category = getArgValue(args, QStringLiteral("--category")).toStdString();
    filter.keyPrefix = getArgValue(args, QStringLiteral("--key-prefix")).toStdString();
    const bool latestOnly = args.contains(QStringLiteral("--latest"));
    const ChangeJournal &journal = loaded.context->journal();
    const std::vector<ChangeEntry> entries =
        latestOnly ? journal.latestPerKey(filter) : journal.query(filter);

    if (format == QStringLiteral("json")) {
        renderJournalJson(*loaded.context, entries, latestOnly);
    } else {
        renderJournalMarkdown(*loaded.context, entries, latestOnly);
    }
    TLOG_INFO(m_logger,
              kComponent,
              QStringLiteral("runJournalReport"),
              QStringLiteral("report_journal"),
              QStringLiteral("user_invocation"),
              QStringLiteral("context_file"),
              (nlohmann::json{{"context", contextPath.toStdString()},
                              {"entries", entries.size()},
                              {"format", format.toStdString()}}));
    return 0;
}

int ReportCli::runRunsReport(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        return 1;
    }

    std::optional<RunMode> mode;
    const QString modeText = getArgValue(args, QStringLiteral("--mode"));
    if (!modeText.isEmpty()) {
        mode = parseModeString(modeText.toStdString());
        if (!mode.has_value()) {
            std::cerr << "Invalid mode. Use apply or rollback." << std::endl;
            return 1;
        }
    }
    const int limit = getArgValue(args, QStringLiteral("--limit")).toInt();

    const AppConfig config = loadAppConfig(getArgValue(args, QStringLiteral("--workspace")));
    try {
        RunIndex index(RunIndex::defaultPath(config.workspaceRoot.toStdString()));
        const std::vector<RunRecord> runs = index.listRuns(mode, limit);
        if (format == QStringLiteral("json")) {
            renderRunsJson(index, runs);
        } else {
            renderRunsMarkdown(runs);
        }
        TLOG_INFO(m_logger,
                  kComponent,
                  QStringLiteral("runRunsReport"),
                  QStringLiteral("report_runs"),
                  QStringLiteral("user_invocation"),
                  QStringLiteral("run_index"),
                  (nlohmann::json{{"runs", runs.size()},
                                  {"workspace", config.workspaceRoot.toStdString()}}));
    } catch (const std::exception &ex) {
        std::cerr << "Failed to open database: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}

int ReportCli::runVerifyReport(const QStringList &args)
{
    const QString contextPath = getArgValue(args, QStringLiteral("--context"));
    const QString format = getFormat(args);
    if (contextPath.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    if (!validFormat(format)) {
        return 1;
    }

    const ContextLoadResult loaded = RunContext::load(contextPath);
    const bool usable = loaded.context.has_value();
    const bool verified = usable && loaded.context->integrityVerified();

    if (format == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["context"] = contextPath.toStdString();
        payload["usable"] = usable;
        payload["integrityVerified"] = verified;
        payload["reason"] = loaded.reason;
        if (usable) {
            payload["runId"] = loaded.context->runId();
            payload["entries"] = loaded.context->journal().size();
        }
        std::cout << payload.dump(2) << std::endl;
    } else {
        std::cout << "# tunelog Context Check\n\n";
        std::cout << "Context: " << contextPath.toStdString() << "\n";
        if (usable) {
            std::cout << "Run: " << loaded.context->runId() << "\n";
            std::cout << "Entries: " << loaded.context->journal().size() << "\n";
            std::cout << "Integrity: " << (verified ? "verified" : "unverified (no digest)")
                      << "\n";
        } else {
            std::cout << "Unusable: " << loaded.reason << "\n";
        }
    }

    TLOG_INFO(m_logger,
              kComponent,
              QStringLiteral("runVerifyReport"),
              QStringLiteral("report_verify"),
              QStringLiteral("user_invocation"),
              QStringLiteral("context_file"),
              (nlohmann::json{{"context", contextPath.toStdString()},
                              {"usable", usable},
                              {"verified", verified}}));
    return usable ? 0 : 1;
}

} // namespace tunelog
