#include "orchestrator/phase_orchestrator.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "journal/run_context.hpp"

namespace tunelog {

namespace {

const QString kComponent = QStringLiteral("PhaseOrchestrator");

} // namespace

PhaseOrchestrator::PhaseOrchestrator(PhaseRunner &runner,
                                     RunContext &context,
                                     logging::Logger &logger,
                                     int defaultTimeoutMs)
    : m_runner(runner)
    , m_context(context)
    , m_logger(logger)
    , m_defaultTimeoutMs(defaultTimeoutMs)
{
}

void PhaseOrchestrator::setHooks(OrchestratorHooks hooks)
{
    m_hooks = std::move(hooks);
}

void PhaseOrchestrator::setOptInValues(std::map<std::string, bool> values)
{
    m_optInValues = std::move(values);
}

PhaseState PhaseOrchestrator::state(const std::string &phaseName) const
{
    const auto it = m_states.find(phaseName);
    return it == m_states.end() ? PhaseState::NotStarted : it->second;
}

UnitInvocation PhaseOrchestrator::invocationFor(const PhaseSpec &phase)
{
    UnitInvocation invocation;
    invocation.mode = m_context.mode();
    invocation.runId = m_context.runId();
    invocation.workspaceRoot = m_context.workspaceRoot();
    invocation.logFile = m_context.logFile();
    invocation.contextFile = m_context.contextFile();
    invocation.targetContextFile = m_context.rollbackTarget();

    for (const OptInSpec &optIn : phase.optIns) {
        bool enabled = false;
        const auto preset = m_optInValues.find(optIn.flag);
        if (preset != m_optInValues.end()) {
            enabled = preset->second;
        } else if (m_hooks.optIn) {
            enabled = m_hooks.optIn(phase, optIn);
        }
        invocation.optIns.emplace_back(optIn.flag, enabled);
        m_context.data()["optIns"][optIn.flag] = enabled;
    }
    return invocation;
}

PhaseResult PhaseOrchestrator::execute(const PhaseSpec &phase)
{
    PhaseResult result;
    result.name = phase.name;
    result.state = PhaseState::Running;
    result.startedAt = std::chrono::system_clock::now();
    m_states[phase.name] = PhaseState::Running;

    const UnitInvocation invocation = invocationFor(phase);
    m_context.persist();

    const int timeoutMs = phase.timeoutMs > 0 ? phase.timeoutMs : m_defaultTimeoutMs;
    const ExecutionResult execution = m_runner.runPhase(phase, invocation, timeoutMs);

    result.exitCode = execution.exitCode;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now() - result.startedAt);
    if (execution.timedOut) {
        result.state = PhaseState::TimedOut;
        result.message = "timed out after " + std::to_string(timeoutMs) + " ms";
    } else if (execution.succeeded()) {
        result.state = PhaseState::Succeeded;
    } else {
        result.state = PhaseState::Failed;
        result.message = execution.errorMessage.isEmpty()
            ? "exit code " + std::to_string(execution.exitCode)
            : execution.errorMessage.toStdString();
    }
    m_states[phase.name] = result.state;
    return result;
}

void PhaseOrchestrator::reloadContext()
{
    ContextLoadResult loaded = RunContext::load(m_context.contextFile());
    if (!loaded.context.has_value()) {
        TLOG_WARN(m_logger,
                  kComponent,
                  QStringLiteral("reloadContext"),
                  QStringLiteral("context_reload_failed"),
                  QString::fromStdString(loaded.reason),
                  QStringLiteral("run_context_load"),
                  (nlohmann::json{{"contextFile", m_context.contextFile().toStdString()}}));
        return;
    }
    m_context = *loaded.context;
}

PipelineResult PhaseOrchestrator::run(const std::vector<PhaseSpec> &phases)
{
    PipelineResult pipeline;
    pipeline.mode = m_context.mode();
    m_states.clear();
    for (const PhaseSpec &phase : phases) {
        m_states[phase.name] = PhaseState::NotStarted;
    }

    TLOG_INFO(m_logger,
              kComponent,
              QStringLiteral("run"),
              QStringLiteral("pipeline_started"),
              QStringLiteral("user_request"),
              QStringLiteral("phase_sequence"),
              (nlohmann::json{{"mode", toModeString(pipeline.mode)},
                              {"runId", m_context.runId()},
                              {"phases", phases.size()},
                              {"rollbackTarget", m_context.rollbackTarget().toStdString()}}));

    bool halted = false;
    for (std::size_t index = 0; index < phases.size(); ++index) {
        const PhaseSpec &phase = phases[index];
        if (halted) {
            PhaseResult skipped;
            skipped.name = phase.name;
            pipeline.phases.push_back(skipped);
            continue;
        }

        if (!phase.confirm.empty() && m_hooks.confirm && !m_hooks.confirm(phase)) {
            TLOG_WARN(m_logger,
                      kComponent,
                      QStringLiteral("run"),
                      QStringLiteral("pipeline_cancelled"),
                      QStringLiteral("confirmation_declined"),
                      QStringLiteral("interactive_prompt"),
                      (nlohmann::json{{"phase", phase.name}}));
            pipeline.cancelled = true;
            pipeline.haltedAt = phase.name;
            halted = true;
            PhaseResult skipped;
            skipped.name = phase.name;
            skipped.message = "cancelled by user";
            pipeline.phases.push_back(skipped);
            continue;
        }

        TLOG_INFO(m_logger,
                  kComponent,
                  QStringLiteral("run"),
                  QStringLiteral("phase_started"),
                  QStringLiteral("phase_sequence"),
                  QStringLiteral("phase_runner"),
                  (nlohmann::json{{"phase", phase.name},
                                  {"title", phase.title},
                                  {"position", std::to_string(index + 1) + "/"
                                                   + std::to_string(phases.size())},
                                  {"advisory", phase.advisory}}));
        if (m_hooks.phaseStarted) {
            m_hooks.phaseStarted(phase);
        }

        PhaseResult result;
        try {
            result = execute(phase);
        } catch (const std::exception &ex) {
            // Persisting the context before launch failed; the unit never ran.
            result.name = phase.name;
            result.state = PhaseState::Failed;
            result.exitCode = -1;
            result.startedAt = std::chrono::system_clock::now();
            result.message = std::string("context persist failed: ") + ex.what();
            m_states[phase.name] = PhaseState::Failed;
        }
        reloadContext();
        pipeline.phases.push_back(result);
        if (m_hooks.phaseFinished) {
            m_hooks.phaseFinished(phase, result);
        }

        const nlohmann::json context{{"phase", phase.name},
                                     {"state", toPhaseStateString(result.state)},
                                     {"exitCode", result.exitCode},
                                     {"durationMs", result.duration.count()},
                                     {"message", result.message}};
        if (result.state == PhaseState::Succeeded) {
            TLOG_INFO(m_logger, kComponent, QStringLiteral("run"), QStringLiteral("phase_succeeded"),
                      QStringLiteral("phase_sequence"), QStringLiteral("phase_runner"), context);
            continue;
        }
        if (phase.advisory) {
            TLOG_WARN(m_logger, kComponent, QStringLiteral("run"),
                      QStringLiteral("advisory_phase_failed"), QStringLiteral("non_blocking_phase"),
                      QStringLiteral("continue_pipeline"), context);
            continue;
        }
        TLOG_ERROR(m_logger, kComponent, QStringLiteral("run"), QStringLiteral("phase_failed"),
                   QStringLiteral("phase_sequence"), QStringLiteral("halt_pipeline"), context);
        pipeline.haltedAt = phase.name;
        halted = true;
    }

    pipeline.succeeded = !halted;
    recordOutcome(pipeline);

    TLOG_INFO(m_logger,
              kComponent,
              QStringLiteral("run"),
              pipeline.succeeded ? QStringLiteral("pipeline_succeeded")
                                 : QStringLiteral("pipeline_halted"),
              QStringLiteral("phase_sequence"),
              QStringLiteral("phase_runner"),
              (nlohmann::json{{"mode", toModeString(pipeline.mode)},
                              {"haltedAt", pipeline.haltedAt},
                              {"cancelled", pipeline.cancelled},
                              {"changes", m_context.journal().size()},
                              {"logFile", m_context.logFile().toStdString()},
                              {"contextFile", m_context.contextFile().toStdString()}}));
    return pipeline;
}

void PhaseOrchestrator::recordOutcome(const PipelineResult &result)
{
    m_context.data()["phases"] = result.phases;
    m_context.data()["succeeded"] = result.succeeded;
    m_context.data()["cancelled"] = result.cancelled;
    m_context.data()["haltedAt"] = result.haltedAt;
    try {
        m_context.persist();
    } catch (const std::exception &ex) {
        TLOG_ERROR(m_logger,
                   kComponent,
                   QStringLiteral("recordOutcome"),
                   QStringLiteral("context_persist_failed"),
                   QStringLiteral("io_error"),
                   QStringLiteral("qsavefile"),
                   (nlohmann::json{{"contextFile", m_context.contextFile().toStdString()},
                                   {"error", ex.what()}}));
    }
}

} // namespace tunelog
