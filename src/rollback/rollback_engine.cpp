#include "rollback/rollback_engine.hpp"

#include <cstdint>
#include <exception>
#include <limits>
#include <set>
#include <utility>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "journal/run_context.hpp"
#include "platform/backend_factory.hpp"
#include "platform/platform_error.hpp"

namespace tunelog {

namespace {

const QString kComponent = QStringLiteral("RollbackEngine");

bool isActiveScheme(const ChangeEntry &entry)
{
    return entry.category == category::PowerCfg && entry.key == kActiveSchemeKey;
}

std::string settingValue(const SnapshotValue &value)
{
    if (value.isInt()) {
        return std::to_string(value.asInt());
    }
    if (value.isString()) {
        return value.asString();
    }
    throw PlatformError(PlatformErrorKind::Unsupported,
                        "setting snapshot is neither integer nor string");
}

} // namespace

RollbackEngine::RollbackEngine(RegistryStore &registry,
                               ServiceManager &services,
                               SettingStore &powercfg,
                               SettingStore &bcdedit,
                               logging::Logger &logger)
    : m_registry(registry)
    , m_services(services)
    , m_powercfg(powercfg)
    , m_bcdedit(bcdedit)
    , m_logger(logger)
{
}

RollbackEngine::RollbackEngine(Backends &backends, logging::Logger &logger)
    : RollbackEngine(*backends.registry,
                     *backends.services,
                     *backends.powercfg,
                     *backends.bcdedit,
                     logger)
{
}

RollbackReport RollbackEngine::rollback(const RunContext &target,
                                        const std::vector<RollbackFilter> &filters)
{
    TLOG_INFO(m_logger,
              kComponent,
              QStringLiteral("rollback"),
              QStringLiteral("rollback_target_loaded"),
              QStringLiteral("rollback_requested"),
              QStringLiteral("run_context"),
              (nlohmann::json{{"targetRunId", target.runId()},
                              {"contextFile", target.contextFile().toStdString()},
                              {"changes", target.journal().size()}}));
    return rollback(target.journal(), filters);
}

RollbackReport RollbackEngine::rollback(const ChangeJournal &journal,
                                        const std::vector<RollbackFilter> &filters)
{
    const std::vector<ChangeEntry> selected = journal.query(filters);

    RollbackReport report;
    report.selected = static_cast<int>(selected.size());

    // The active scheme is restored from its last entry only; every other
    // key from its first entry, which holds the pre-run state.
    std::size_t lastActiveScheme = selected.size();
    for (std::size_t i = 0; i < selected.size(); ++i) {
        if (isActiveScheme(selected[i])) {
            lastActiveScheme = i;
        }
    }

    std::set<std::pair<std::string, std::string>> handled;
    for (std::size_t i = 0; i < selected.size(); ++i) {
        const ChangeEntry &entry = selected[i];
        if (isActiveScheme(entry)) {
            if (i != lastActiveScheme) {
                continue;
            }
        } else if (!handled.insert({entry.category, entry.key}).second) {
            continue;
        }

        try {
            bool deleted = false;
            if (entry.category == category::Registry) {
                deleted = restoreRegistry(entry);
            } else if (entry.category == category::Service) {
                restoreService(entry);
            } else if (SettingStore *store = settingStoreFor(entry.category)) {
                deleted = restoreSetting(*store, entry);
            } else {
                TLOG_WARN(m_logger,
                          kComponent,
                          QStringLiteral("rollback"),
                          QStringLiteral("unknown_category_skipped"),
                          QStringLiteral("no_backend_for_category"),
                          QStringLiteral("category_dispatch"),
                          (nlohmann::json{{"category", entry.category}, {"key", entry.key}}));
                ++report.skipped;
                continue;
            }

            if (deleted) {
                ++report.deleted;
            } else {
                ++report.restored;
            }
            TLOG_INFO(m_logger,
                      kComponent,
                      QStringLiteral("rollback"),
                      deleted ? QStringLiteral("value_deleted") : QStringLiteral("value_restored"),
                      QStringLiteral("rollback_replay"),
                      QStringLiteral("platform_backend"),
                      (nlohmann::json{{"category", entry.category},
                                      {"key", entry.key},
                                      {"restored", entry.before}}));
        } catch (const std::exception &ex) {
            report.failures.push_back({entry.category, entry.key, ex.what()});
            TLOG_WARN(m_logger,
                      kComponent,
                      QStringLiteral("rollback"),
                      QStringLiteral("restore_failed"),
                      QStringLiteral("platform_error"),
                      QStringLiteral("best_effort_continue"),
                      (nlohmann::json{{"category", entry.category},
                                      {"key", entry.key},
                                      {"error", ex.what()}}));
        }
    }

    TLOG_INFO(m_logger,
              kComponent,
              QStringLiteral("rollback"),
              QStringLiteral("rollback_finished"),
              QStringLiteral("rollback_replay"),
              QStringLiteral("journal_query"),
              (nlohmann::json{{"selected", report.selected},
                              {"restored", report.restored},
                              {"deleted", report.deleted},
                              {"skipped", report.skipped},
                              {"failed", report.failed()}}));
    return report;
}

bool RollbackEngine::restoreRegistry(const ChangeEntry &entry)
{
    const auto [path, name] = splitRegistryJournalKey(entry.key);
    if (entry.before.isAbsent()) {
        m_registry.remove(path, name);
        return true;
    }
    if (entry.before.isInt()) {
        const std::int64_t value = entry.before.asInt();
        const bool fitsDWord = value >= 0
            && value <= static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max());
        RegistryValueKind kind = fitsDWord ? RegistryValueKind::DWord : RegistryValueKind::QWord;
        if (entry.beforeKind == RegistryValueKind::QWord
            || (entry.beforeKind == RegistryValueKind::DWord && fitsDWord)) {
            kind = *entry.beforeKind;
        }
        m_registry.write(path, name, entry.before, kind);
        return false;
    }
    if (entry.before.isString()) {
        const RegistryValueKind kind = entry.beforeKind == RegistryValueKind::ExpandString
            ? RegistryValueKind::ExpandString
            : RegistryValueKind::String;
        m_registry.write(path, name, entry.before, kind);
        return false;
    }
    throw PlatformError(PlatformErrorKind::Unsupported,
                        "registry snapshot holds a service state");
}

void RollbackEngine::restoreService(const ChangeEntry &entry)
{
    if (!entry.before.isService()) {
        throw PlatformError(PlatformErrorKind::Unsupported,
                            "service entry without a service snapshot");
    }
    const ServiceStateSnapshot &snapshot = entry.before.asService();

    auto startupType = parseStartupTypeString(snapshot.startupType);
    if (!startupType.has_value()) {
        TLOG_WARN(m_logger,
                  kComponent,
                  QStringLiteral("restoreService"),
                  QStringLiteral("unknown_startup_type"),
                  QStringLiteral("unrecognized_snapshot_value"),
                  QStringLiteral("fallback_manual"),
                  (nlohmann::json{{"service", entry.key},
                                  {"startupType", snapshot.startupType}}));
        startupType = StartupType::Manual;
    }
    m_services.setStartupType(entry.key, *startupType);

    const ServiceStatus status = parseServiceStatusString(snapshot.status);
    if (status == ServiceStatus::Running) {
        m_services.start(entry.key);
    } else if (status == ServiceStatus::Stopped) {
        m_services.stop(entry.key);
    } else {
        TLOG_DEBUG(m_logger,
                   kComponent,
                   QStringLiteral("restoreService"),
                   QStringLiteral("run_state_left_as_is"),
                   QStringLiteral("transient_snapshot_status"),
                   QStringLiteral("service_control"),
                   (nlohmann::json{{"service", entry.key}, {"status", snapshot.status}}));
    }
}

bool RollbackEngine::restoreSetting(SettingStore &store, const ChangeEntry &entry)
{
    if (entry.before.isAbsent()) {
        store.remove(entry.key);
        return true;
    }
    store.write(entry.key, settingValue(entry.before));
    return false;
}

SettingStore *RollbackEngine::settingStoreFor(const std::string &categoryName)
{
    if (categoryName == category::PowerCfg) {
        return &m_powercfg;
    }
    if (categoryName == category::BcdEdit) {
        return &m_bcdedit;
    }
    return nullptr;
}

} // namespace tunelog
