#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "orchestrator/process_executor.hpp"

namespace tunelog::logging {
class Logger;
}

namespace tunelog {

class RunContext;

struct OrchestratorHooks {
    // Asked before a phase that carries a confirmation prompt. Unset means
    // every confirmation is granted.
    std::function<bool(const PhaseSpec &phase)> confirm;
    // Asked for opt-ins that have no preset value. Unset means false.
    std::function<bool(const PhaseSpec &phase, const OptInSpec &optIn)> optIn;
    std::function<void(const PhaseSpec &phase)> phaseStarted;
    std::function<void(const PhaseSpec &phase, const PhaseResult &result)> phaseFinished;
};

// Sequences mutator units for one run. Every phase moves
// NotStarted -> Running -> Succeeded | Failed | TimedOut; the first
// non-success of a non-advisory phase halts the pipeline.
class PhaseOrchestrator {
public:
    PhaseOrchestrator(PhaseRunner &runner,
                      RunContext &context,
                      logging::Logger &logger,
                      int defaultTimeoutMs);

    void setHooks(OrchestratorHooks hooks);
    // Answers given up front (command line); they are not prompted for.
    void setOptInValues(std::map<std::string, bool> values);

    // The context is persisted before the first phase and reloaded after
    // each one, since the units append to the same file.
    PipelineResult run(const std::vector<PhaseSpec> &phases);

    PhaseState state(const std::string &phaseName) const;

private:
    UnitInvocation invocationFor(const PhaseSpec &phase);
    PhaseResult execute(const PhaseSpec &phase);
    void reloadContext();
    void recordOutcome(const PipelineResult &result);

    PhaseRunner &m_runner;
    RunContext &m_context;
    logging::Logger &m_logger;
    int m_defaultTimeoutMs;
    OrchestratorHooks m_hooks;
    std::map<std::string, bool> m_optInValues;
    std::map<std::string, PhaseState> m_states;
};

} // namespace tunelog
