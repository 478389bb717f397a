#include "journal/run_index.hpp"

#include <cstdint>
#include <filesystem>
#include <stdexcept>

#include <sqlite3.h>

#include "common/json_utils.hpp"

namespace tunelog {

namespace {

constexpr const char *kCreateRunsTable =
    "CREATE TABLE IF NOT EXISTS runs ("
    "    run_id TEXT PRIMARY KEY,"
    "    mode TEXT NOT NULL,"
    "    started_at INTEGER NOT NULL,"
    "    finished_at INTEGER,"
    "    status TEXT NOT NULL,"
    "    context_file TEXT NOT NULL,"
    "    log_file TEXT,"
    "    rollback_target TEXT,"
    "    change_count INTEGER DEFAULT 0"
    ");";

constexpr const char *kCreatePhaseResultsTable =
    "CREATE TABLE IF NOT EXISTS phase_results ("
    "    run_id TEXT NOT NULL,"
    "    position INTEGER NOT NULL,"
    "    name TEXT NOT NULL,"
    "    state TEXT NOT NULL,"
    "    exit_code INTEGER,"
    "    started_at INTEGER,"
    "    duration_ms INTEGER,"
    "    message TEXT,"
    "    PRIMARY KEY (run_id, position)"
    ");";

constexpr const char *kRunColumns =
    "SELECT run_id, mode, started_at, finished_at, status, context_file, "
    "log_file, rollback_target, change_count FROM runs";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

int64_t toEpochSeconds(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               timestamp.time_since_epoch())
        .count();
}

std::chrono::system_clock::time_point fromEpochSeconds(int64_t value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::seconds{value}};
}

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw std::runtime_error(message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    if (value.empty()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    bindText(stmt, index, value);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

RunRecord readRun(sqlite3_stmt *stmt)
{
    RunRecord record;
    record.runId = columnText(stmt, 0);
    record.mode = parseModeString(columnText(stmt, 1)).value_or(RunMode::Apply);
    record.startedAt = fromEpochSeconds(sqlite3_column_int64(stmt, 2));
    record.finishedAt = fromEpochSeconds(sqlite3_column_int64(stmt, 3));
    record.status = columnText(stmt, 4);
    record.contextFile = columnText(stmt, 5);
    record.logFile = columnText(stmt, 6);
    record.rollbackTarget = columnText(stmt, 7);
    record.changeCount = sqlite3_column_int(stmt, 8);
    return record;
}

} // namespace

struct RunIndex::Impl {
    sqlite3 *db = nullptr;
};

RunIndex::RunIndex(const std::string &dbPath)
    : impl(std::make_unique<Impl>())
{
    const std::filesystem::path path(dbPath);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    if (sqlite3_open(dbPath.c_str(), &impl->db) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw std::runtime_error("failed to open run index " + dbPath + ": " + message);
    }
    sqlite3_busy_timeout(impl->db, 2000);

    execOrThrow(impl->db, kCreateRunsTable);
    execOrThrow(impl->db, kCreatePhaseResultsTable);
}

RunIndex::~RunIndex()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

std::string RunIndex::defaultPath(const std::string &workspaceRoot)
{
    return (std::filesystem::path(workspaceRoot) / "Logs" / "runs.db").string();
}

void RunIndex::upsertRun(const RunRecord &record)
{
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO runs (run_id, mode, started_at, finished_at, "
                   "status, context_file, log_file, rollback_target, change_count) "
                   "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);");
    bindText(stmt.get(), 1, record.runId);
    bindText(stmt.get(), 2, toModeString(record.mode));
    sqlite3_bind_int64(stmt.get(), 3, toEpochSeconds(record.startedAt));
    sqlite3_bind_int64(stmt.get(), 4, toEpochSeconds(record.finishedAt));
    bindText(stmt.get(), 5, record.status);
    bindText(stmt.get(), 6, record.contextFile);
    bindOptionalText(stmt.get(), 7, record.logFile);
    bindOptionalText(stmt.get(), 8, record.rollbackTarget);
    sqlite3_bind_int(stmt.get(), 9, record.changeCount);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("failed to upsert run " + record.runId);
    }
}

void RunIndex::addPhaseResult(const std::string &runId, int position, const PhaseResult &result)
{
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO phase_results (run_id, position, name, state, "
                   "exit_code, started_at, duration_ms, message) "
                   "VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
    bindText(stmt.get(), 1, runId);
    sqlite3_bind_int(stmt.get(), 2, position);
    bindText(stmt.get(), 3, result.name);
    bindText(stmt.get(), 4, toPhaseStateString(result.state));
    sqlite3_bind_int(stmt.get(), 5, result.exitCode);
    sqlite3_bind_int64(stmt.get(), 6, toEpochSeconds(result.startedAt));
    sqlite3_bind_int64(stmt.get(), 7, static_cast<int64_t>(result.duration.count()));
    bindOptionalText(stmt.get(), 8, result.message);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("failed to insert phase result for " + runId);
    }
}

std::optional<RunRecord> RunIndex::getRun(const std::string &runId) const
{
    const std::string sql = std::string(kRunColumns) + " WHERE run_id = ?;";
    Statement stmt(impl->db, sql.c_str());
    bindText(stmt.get(), 1, runId);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return readRun(stmt.get());
}

std::vector<RunRecord> RunIndex::listRuns(std::optional<RunMode> mode, int limit) const
{
    std::string sql = kRunColumns;
    if (mode.has_value()) {
        sql += " WHERE mode = ?";
    }
    sql += " ORDER BY started_at DESC, run_id DESC";
    if (limit > 0) {
        sql += " LIMIT ?";
    }
    sql += ";";

    Statement stmt(impl->db, sql.c_str());
    int bindIndex = 1;
    if (mode.has_value()) {
        bindText(stmt.get(), bindIndex++, toModeString(*mode));
    }
    if (limit > 0) {
        sqlite3_bind_int(stmt.get(), bindIndex++, limit);
    }

    std::vector<RunRecord> runs;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        runs.push_back(readRun(stmt.get()));
    }
    return runs;
}

std::vector<PhaseResult> RunIndex::phaseResults(const std::string &runId) const
{
    Statement stmt(impl->db,
                   "SELECT name, state, exit_code, started_at, duration_ms, message "
                   "FROM phase_results WHERE run_id = ? ORDER BY position ASC;");
    bindText(stmt.get(), 1, runId);

    std::vector<PhaseResult> results;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        PhaseResult result;
        result.name = columnText(stmt.get(), 0);
        result.state = parsePhaseStateString(columnText(stmt.get(), 1));
        result.exitCode = sqlite3_column_int(stmt.get(), 2);
        result.startedAt = fromEpochSeconds(sqlite3_column_int64(stmt.get(), 3));
        result.duration = std::chrono::milliseconds(sqlite3_column_int64(stmt.get(), 4));
        result.message = columnText(stmt.get(), 5);
        results.push_back(result);
    }
    return results;
}

} // namespace tunelog
