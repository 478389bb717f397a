#pragma once

#include <map>
#include <string>

#include <QString>

#include "common/enums.hpp"
#include "unit/phase_profile.hpp"

namespace tunelog::logging {
class Logger;
}

namespace tunelog {

struct Backends;

inline constexpr int kUnitExitOk = 0;
inline constexpr int kUnitExitFailure = 1;
inline constexpr int kUnitExitRollbackTargetMissing = 2;
inline constexpr int kUnitExitUsage = 64;

struct UnitOptions {
    RunMode mode = RunMode::Apply;
    std::string runId;
    QString workspaceRoot;
    QString logFile;
    QString contextFile;
    QString targetContextFile;
    QString profilePath;
    std::map<std::string, bool> optIns;
};

// Executes one phase profile against the run context named in the options.
// Apply journals every change through the mutators; Rollback replays the
// profile's slice of the target context.
class UnitRunner {
public:
    UnitRunner(UnitOptions options,
               PhaseProfile profile,
               Backends &backends,
               logging::Logger &logger);

    // Process exit code.
    int run();

private:
    int apply();
    int rollback();
    bool optInEnabled(const std::string &flag) const;

    UnitOptions m_options;
    PhaseProfile m_profile;
    Backends &m_backends;
    logging::Logger &m_logger;
};

} // namespace tunelog
