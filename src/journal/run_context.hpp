#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <QString>
#include <QStringList>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"
#include "journal/change_journal.hpp"

namespace tunelog {

struct ContextLoadResult;

// Per-run aggregate: identifiers, workspace paths and the Change Journal.
// The persisted file is the rollback source for later invocations.
class RunContext {
public:
    static constexpr int kSchemaVersion = 1;

    RunContext() = default;
    RunContext(const RunContext &other);
    RunContext &operator=(const RunContext &other);

    // Derives the log and context file locations from the run id and makes
    // sure the workspace directories exist.
    static RunContext create(const std::string &runId,
                             const QString &workspaceRoot,
                             RunMode mode = RunMode::Apply);
    static std::string generateRunId();
    static ContextLoadResult load(const QString &path);

    // Atomic write of the current in-memory state. Throws std::runtime_error.
    void persist() const;
    void persist(const QString &path) const;

    // Persist on every journal append.
    void enableAutoPersist();
    bool isAutoPersistEnabled() const { return m_autoPersist; }

    const std::string &runId() const { return m_runId; }
    RunMode mode() const { return m_mode; }
    std::chrono::system_clock::time_point createdAt() const { return m_createdAt; }
    const QString &workspaceRoot() const { return m_workspaceRoot; }
    const QString &logFile() const { return m_logFile; }
    const QString &contextFile() const { return m_contextFile; }

    const QString &rollbackTarget() const { return m_rollbackTarget; }
    void setRollbackTarget(const QString &path) { m_rollbackTarget = path; }

    // Free-form metadata written by the orchestrator (hardware notes, options).
    nlohmann::json &data() { return m_data; }
    const nlohmann::json &data() const { return m_data; }

    // False when a loaded file carried no digest.
    bool integrityVerified() const { return m_integrityVerified; }

    ChangeJournal &journal() { return m_journal; }
    const ChangeJournal &journal() const { return m_journal; }

    QString absPath(const QStringList &parts) const;

    nlohmann::json toJson() const;
    static std::string journalDigest(const nlohmann::json &changes);

private:
    void installPersistHook();

    std::string m_runId;
    RunMode m_mode = RunMode::Apply;
    std::chrono::system_clock::time_point m_createdAt;
    QString m_workspaceRoot;
    QString m_logFile;
    QString m_contextFile;
    QString m_rollbackTarget;
    nlohmann::json m_data = nlohmann::json::object();
    bool m_integrityVerified = true;
    bool m_autoPersist = false;
    ChangeJournal m_journal;
};

// load() never throws: a missing, partial or tampered file comes back with
// an empty context and the reason.
struct ContextLoadResult {
    std::optional<RunContext> context;
    std::string reason;
};

} // namespace tunelog
