#pragma once

#include <optional>
#include <string>

#include "common/enums.hpp"
#include "common/models.hpp"
#include "common/result.hpp"
#include "journal/change_journal.hpp"
#include "platform/registry_store.hpp"
#include "platform/service_manager.hpp"
#include "platform/setting_store.hpp"

namespace tunelog::logging {
class Logger;
}

namespace tunelog {

struct Backends;

// Typed setters that read the prior state, apply the change, read it back
// and append exactly one ChangeEntry. Backend exceptions never escape; every
// failure comes back as an Error in the result.
class KeyValueMutators {
public:
    KeyValueMutators(ChangeJournal &journal,
                     RegistryStore &registry,
                     ServiceManager &services,
                     SettingStore &powercfg,
                     SettingStore &bcdedit,
                     logging::Logger &logger);
    KeyValueMutators(ChangeJournal &journal, Backends &backends, logging::Logger &logger);

    // value must be Int for the integer kinds and String (or Int) for the
    // string kinds.
    MutationResult setRegistryValue(const std::string &path,
                                    const std::string &name,
                                    const SnapshotValue &value,
                                    RegistryValueKind kind,
                                    const std::string &note);

    // Applies only the transitions that differ from the current state; a
    // request already satisfied returns nullopt and records nothing.
    // desiredRunState accepts Running or Stopped.
    MutationResult setService(const std::string &name,
                              std::optional<StartupType> desiredStartupType,
                              std::optional<ServiceStatus> desiredRunState,
                              const std::string &note);

    MutationResult setActivePowerScheme(const std::string &schemeGuid, const std::string &note);
    MutationResult setBootOption(const std::string &element,
                                 const std::string &value,
                                 const std::string &note);

private:
    MutationResult setSetting(SettingStore &store,
                              const char *category,
                              const std::string &key,
                              const std::string &value,
                              const std::string &note);
    MutationResult journal(const std::string &category,
                           const std::string &key,
                           const SnapshotValue &before,
                           const SnapshotValue &after,
                           const std::string &note,
                           std::optional<RegistryValueKind> beforeKind = std::nullopt);
    Error fail(ErrorKind kind,
               const std::string &where,
               const std::string &key,
               const std::string &message,
               std::optional<ChangeEntry> recorded = std::nullopt);

    ChangeJournal &m_journal;
    RegistryStore &m_registry;
    ServiceManager &m_services;
    SettingStore &m_powercfg;
    SettingStore &m_bcdedit;
    logging::Logger &m_logger;
};

} // namespace tunelog
