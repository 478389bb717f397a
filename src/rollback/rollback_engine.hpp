#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"
#include "journal/change_journal.hpp"
#include "platform/registry_store.hpp"
#include "platform/service_manager.hpp"
#include "platform/setting_store.hpp"

namespace tunelog::logging {
class Logger;
}

namespace tunelog {

struct Backends;
class RunContext;

struct RollbackFailure {
    std::string category;
    std::string key;
    std::string message;
};

struct RollbackReport {
    int selected = 0;
    int restored = 0;
    int deleted = 0;
    int skipped = 0;
    std::vector<RollbackFailure> failures;

    int failed() const { return static_cast<int>(failures.size()); }
};

// Replays a journal backwards onto the live system. Best effort: a key that
// cannot be restored is logged and counted, and the remaining keys are still
// processed. Restorations are not journaled.
class RollbackEngine {
public:
    RollbackEngine(RegistryStore &registry,
                   ServiceManager &services,
                   SettingStore &powercfg,
                   SettingStore &bcdedit,
                   logging::Logger &logger);
    RollbackEngine(Backends &backends, logging::Logger &logger);

    // An empty filter list selects every entry.
    RollbackReport rollback(const ChangeJournal &journal,
                            const std::vector<RollbackFilter> &filters = {});
    RollbackReport rollback(const RunContext &target,
                            const std::vector<RollbackFilter> &filters = {});

private:
    // Returns true when the value was deleted rather than written.
    bool restoreRegistry(const ChangeEntry &entry);
    void restoreService(const ChangeEntry &entry);
    bool restoreSetting(SettingStore &store, const ChangeEntry &entry);
    SettingStore *settingStoreFor(const std::string &categoryName);

    RegistryStore &m_registry;
    ServiceManager &m_services;
    SettingStore &m_powercfg;
    SettingStore &m_bcdedit;
    logging::Logger &m_logger;
};

} // namespace tunelog
