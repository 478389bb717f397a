#include "unit/unit_runner.hpp"

#include <exception>
#include <iostream>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "journal/run_context.hpp"
#include "mutators/key_value_mutators.hpp"
#include "platform/backend_factory.hpp"
#include "rollback/rollback_engine.hpp"

namespace tunelog {

namespace {

const QString kComponent = QStringLiteral("UnitRunner");

MutationResult applyAction(KeyValueMutators &mutators, const ProfileAction &action)
{
    switch (action.type) {
    case ActionType::Registry:
        return mutators.setRegistryValue(action.path, action.name, action.value, action.kind,
                                         action.note);
    case ActionType::Service:
        return mutators.setService(action.name, action.startupType, action.runState, action.note);
    case ActionType::PowerCfg:
        return mutators.setActivePowerScheme(action.settingValue, action.note);
    case ActionType::BcdEdit:
        return mutators.setBootOption(action.element, action.settingValue, action.note);
    }
    return Error{ErrorKind::MutatorFailure, "unknown action type", std::nullopt};
}

} // namespace

UnitRunner::UnitRunner(UnitOptions options,
                       PhaseProfile profile,
                       Backends &backends,
                       logging::Logger &logger)
    : m_options(std::move(options))
    , m_profile(std::move(profile))
    , m_backends(backends)
    , m_logger(logger)
{
}

bool UnitRunner::optInEnabled(const std::string &flag) const
{
    const auto it = m_options.optIns.find(flag);
    return it != m_options.optIns.end() && it->second;
}

int UnitRunner::run()
{
    TLOG_INFO(m_logger,
              kComponent,
              QStringLiteral("run"),
              QStringLiteral("unit_started"),
              QStringLiteral("orchestrator_invocation"),
              QStringLiteral("phase_profile"),
              (nlohmann::json{{"phase", m_profile.phase},
                              {"description", m_profile.description},
                              {"mode", toModeString(m_options.mode)},
                              {"actions", m_profile.actions.size()},
                              {"profile", m_options.profilePath.toStdString()}}));
    return m_options.mode == RunMode::Apply ? apply() : rollback();
}

int UnitRunner::apply()
{
    ContextLoadResult loaded = RunContext::load(m_options.contextFile);
    if (!loaded.context.has_value()) {
        TLOG_ERROR(m_logger,
                   kComponent,
                   QStringLiteral("apply"),
                   QStringLiteral("run_context_unavailable"),
                   QString::fromStdString(loaded.reason),
                   QStringLiteral("run_context_load"),
                   (nlohmann::json{{"contextFile", m_options.contextFile.toStdString()}}));
        std::cerr << m_profile.phase << ": run context unavailable (" << loaded.reason << ")\n";
        return kUnitExitFailure;
    }

    RunContext context = *loaded.context;
    context.enableAutoPersist();
    KeyValueMutators mutators(context.journal(), m_backends, m_logger);

    int applied = 0;
    int unchanged = 0;
    int failed = 0;
    for (const ProfileAction &action : m_profile.actions) {
        if (!action.optIn.empty() && !optInEnabled(action.optIn)) {
            TLOG_INFO(m_logger,
                      kComponent,
                      QStringLiteral("apply"),
                      QStringLiteral("action_skipped"),
                      QStringLiteral("opt_in_not_given"),
                      QStringLiteral("phase_profile"),
                      (nlohmann::json{{"key", action.journalKey()}, {"optIn", action.optIn}}));
            continue;
        }

        const MutationResult result = applyAction(mutators, action);
        if (result.ok()) {
            if (result.value().has_value()) {
                ++applied;
            } else {
                ++unchanged;
            }
            continue;
        }

        ++failed;
        const Error &error = result.error();
        const nlohmann::json errorContext{{"category", action.journalCategory()},
                                          {"key", action.journalKey()},
                                          {"kind", errorKindName(error.kind)},
                                          {"error", error.message},
                                          {"journaled", error.recorded.has_value()}};
        if (action.continueOnError) {
            TLOG_WARN(m_logger, kComponent, QStringLiteral("apply"),
                      QStringLiteral("action_failed_continuing"), QStringLiteral("on_error_continue"),
                      QStringLiteral("phase_profile"), errorContext);
            continue;
        }
        TLOG_ERROR(m_logger, kComponent, QStringLiteral("apply"), QStringLiteral("action_failed"),
                   QStringLiteral("on_error_abort"), QStringLiteral("phase_profile"), errorContext);
        std::cerr << m_profile.phase << ": " << action.journalKey() << ": " << error.message
                  << "\n";
        return kUnitExitFailure;
    }

    std::cout << m_profile.phase << ": " << applied << " changed, " << unchanged
              << " already set, " << failed << " failed\n";
    return kUnitExitOk;
}

int UnitRunner::rollback()
{
    if (m_options.targetContextFile.isEmpty()) {
        TLOG_ERROR(m_logger,
                   kComponent,
                   QStringLiteral("rollback"),
                   QStringLiteral("rollback_target_missing"),
                   QStringLiteral("no_target_argument"),
                   QStringLiteral("argument_check"),
                   nlohmann::json::object());
        std::cerr << m_profile.phase << ": rollback needs --target-context-file\n";
        return kUnitExitRollbackTargetMissing;
    }

    ContextLoadResult target = RunContext::load(m_options.targetContextFile);
    if (!target.context.has_value()) {
        TLOG_ERROR(m_logger,
                   kComponent,
                   QStringLiteral("rollback"),
                   QStringLiteral("rollback_target_missing"),
                   QString::fromStdString(target.reason),
                   QStringLiteral("run_context_load"),
                   (nlohmann::json{{"target", m_options.targetContextFile.toStdString()}}));
        std::cerr << m_profile.phase << ": rollback target unusable (" << target.reason << ")\n";
        return kUnitExitRollbackTargetMissing;
    }
    if (!target.context->integrityVerified()) {
        TLOG_WARN(m_logger,
                  kComponent,
                  QStringLiteral("rollback"),
                  QStringLiteral("rollback_target_unverified"),
                  QStringLiteral("no_integrity_digest"),
                  QStringLiteral("run_context_load"),
                  (nlohmann::json{{"target", m_options.targetContextFile.toStdString()}}));
    }

    const std::vector<RollbackFilter> filters = m_profile.effectiveRollbackFilters();
    if (filters.empty()) {
        TLOG_INFO(m_logger,
                  kComponent,
                  QStringLiteral("rollback"),
                  QStringLiteral("nothing_to_roll_back"),
                  QStringLiteral("profile_has_no_filters"),
                  QStringLiteral("phase_profile"),
                  (nlohmann::json{{"phase", m_profile.phase}}));
        std::cout << m_profile.phase << ": nothing to roll back\n";
        return kUnitExitOk;
    }

    RollbackEngine engine(m_backends, m_logger);
    const RollbackReport report = engine.rollback(*target.context, filters);

    const nlohmann::json summary{{"target", m_options.targetContextFile.toStdString()},
                                 {"selected", report.selected},
                                 {"restored", report.restored},
                                 {"deleted", report.deleted},
                                 {"skipped", report.skipped},
                                 {"failed", report.failed()}};
    ContextLoadResult own = RunContext::load(m_options.contextFile);
    if (own.context.has_value()) {
        RunContext context = *own.context;
        context.data()["rollback"][m_profile.phase] = summary;
        try {
            context.persist();
        } catch (const std::exception &ex) {
            TLOG_WARN(m_logger, kComponent, QStringLiteral("rollback"),
                      QStringLiteral("context_persist_failed"), QStringLiteral("io_error"),
                      QStringLiteral("qsavefile"), (nlohmann::json{{"error", ex.what()}}));
        }
    }

    std::cout << m_profile.phase << ": " << report.restored << " restored, " << report.deleted
              << " deleted, " << report.failed() << " failed\n";
    return kUnitExitOk;
}

} // namespace tunelog
