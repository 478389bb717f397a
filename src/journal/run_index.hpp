#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace tunelog {

// RunIndex is the SQLite catalogue of runs in a workspace and the outcome
// of each of their phases. The context files stay the source of truth; the
// index only makes them discoverable.
class RunIndex {
public:
    // Creates the database and its tables when missing. Throws
    // std::runtime_error when the file cannot be opened.
    explicit RunIndex(const std::string &dbPath);
    ~RunIndex();

    RunIndex(const RunIndex &) = delete;
    RunIndex &operator=(const RunIndex &) = delete;

    // <workspace>/Logs/runs.db
    static std::string defaultPath(const std::string &workspaceRoot);

    // Insert or replace by run id.
    void upsertRun(const RunRecord &record);
    void addPhaseResult(const std::string &runId, int position, const PhaseResult &result);

    std::optional<RunRecord> getRun(const std::string &runId) const;
    // Newest first. A limit of 0 or less returns every run.
    std::vector<RunRecord> listRuns(std::optional<RunMode> mode = std::nullopt,
                                    int limit = 0) const;
    std::vector<PhaseResult> phaseResults(const std::string &runId) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace tunelog
