#include "mutators/key_value_mutators.hpp"

#include <exception>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "platform/backend_factory.hpp"
#include "platform/platform_error.hpp"

namespace tunelog {

namespace {

const QString kComponent = QStringLiteral("KeyValueMutators");

std::string unverifiedNote(const std::string &note)
{
    return note.empty() ? std::string("unverified") : note + " (unverified)";
}

} // namespace

KeyValueMutators::KeyValueMutators(ChangeJournal &journal,
                                   RegistryStore &registry,
                                   ServiceManager &services,
                                   SettingStore &powercfg,
                                   SettingStore &bcdedit,
                                   logging::Logger &logger)
    : m_journal(journal)
    , m_registry(registry)
    , m_services(services)
    , m_powercfg(powercfg)
    , m_bcdedit(bcdedit)
    , m_logger(logger)
{
}

KeyValueMutators::KeyValueMutators(ChangeJournal &journal,
                                   Backends &backends,
                                   logging::Logger &logger)
    : KeyValueMutators(journal,
                       *backends.registry,
                       *backends.services,
                       *backends.powercfg,
                       *backends.bcdedit,
                       logger)
{
}

Error KeyValueMutators::fail(ErrorKind kind,
                             const std::string &where,
                             const std::string &key,
                             const std::string &message,
                             std::optional<ChangeEntry> recorded)
{
    TLOG_WARN(m_logger,
              kComponent,
              QString::fromStdString(where),
              QStringLiteral("mutation_failed"),
              QString::fromLatin1(errorKindName(kind)),
              QStringLiteral("platform_backend"),
              (nlohmann::json{{"key", key},
                              {"error", message},
                              {"journaled", recorded.has_value()}}));
    return Error{kind, message, std::move(recorded)};
}

MutationResult KeyValueMutators::journal(const std::string &category,
                                         const std::string &key,
                                         const SnapshotValue &before,
                                         const SnapshotValue &after,
                                         const std::string &note,
                                         std::optional<RegistryValueKind> beforeKind)
{
    try {
        const ChangeEntry entry = m_journal.record(category, key, before, after, note, beforeKind);
        TLOG_INFO(m_logger,
                  kComponent,
                  QStringLiteral("journal"),
                  QStringLiteral("change_recorded"),
                  QStringLiteral("mutation_applied"),
                  QStringLiteral("change_journal"),
                  (nlohmann::json{{"category", category},
                                  {"key", key},
                                  {"before", before},
                                  {"after", after},
                                  {"note", note}}));
        return MutationResult(std::optional<ChangeEntry>(entry));
    } catch (const std::exception &ex) {
        // record() keeps the entry in memory before persisting.
        std::optional<ChangeEntry> recorded;
        if (!m_journal.empty()) {
            recorded = m_journal.entries().back();
        }
        return fail(ErrorKind::JournalWriteFailure, "journal", key,
                    std::string("persist failed: ") + ex.what(), recorded);
    }
}

MutationResult KeyValueMutators::setRegistryValue(const std::string &path,
                                                  const std::string &name,
                                                  const SnapshotValue &value,
                                                  RegistryValueKind kind,
                                                  const std::string &note)
{
    const std::string key = registryJournalKey(path, name);
    if (name.find('\\') != std::string::npos) {
        return fail(ErrorKind::MutatorFailure, "setRegistryValue", key,
                    "value names with a backslash cannot be journaled");
    }
    if (value.isAbsent() || value.isService()) {
        return fail(ErrorKind::MutatorFailure, "setRegistryValue", key,
                    "registry values take an integer or string");
    }
    if ((kind == RegistryValueKind::DWord || kind == RegistryValueKind::QWord) && !value.isInt()) {
        return fail(ErrorKind::MutatorFailure, "setRegistryValue", key,
                    toRegistryKindString(kind) + " needs an integer value");
    }

    try {
        m_registry.ensureKey(path);
    } catch (const std::exception &ex) {
        return fail(ErrorKind::StateWriteFailure, "setRegistryValue", key, ex.what());
    }

    SnapshotValue before;
    std::optional<RegistryValueKind> beforeKind;
    try {
        before = m_registry.read(path, name);
        if (!before.isAbsent()) {
            beforeKind = m_registry.readKind(path, name);
        }
    } catch (const std::exception &ex) {
        return fail(ErrorKind::StateReadFailure, "setRegistryValue", key, ex.what());
    }

    try {
        m_registry.write(path, name, value, kind);
    } catch (const std::exception &ex) {
        return fail(ErrorKind::StateWriteFailure, "setRegistryValue", key, ex.what());
    }

    SnapshotValue after;
    try {
        after = m_registry.read(path, name);
    } catch (const std::exception &ex) {
        MutationResult recorded = journal(category::Registry, key, before, value,
                                          unverifiedNote(note), beforeKind);
        if (!recorded.ok()) {
            return recorded;
        }
        return fail(ErrorKind::StateReadFailure, "setRegistryValue", key,
                    std::string("read-back failed: ") + ex.what(), *recorded.value());
    }
    return journal(category::Registry, key, before, after, note, beforeKind);
}

MutationResult KeyValueMutators::setService(const std::string &name,
                                            std::optional<StartupType> desiredStartupType,
                                            std::optional<ServiceStatus> desiredRunState,
                                            const std::string &note)
{
    if (desiredRunState.has_value() && *desiredRunState != ServiceStatus::Running
        && *desiredRunState != ServiceStatus::Stopped) {
        return fail(ErrorKind::MutatorFailure, "setService", name,
                    "run state must be Running or Stopped, got "
                        + toServiceStatusString(*desiredRunState));
    }

    ServiceStateSnapshot before;
    try {
        before = m_services.query(name);
    } catch (const std::exception &ex) {
        return fail(ErrorKind::StateReadFailure, "setService", name, ex.what());
    }

    const bool changeStartup = desiredStartupType.has_value()
        && before.startupType != toStartupTypeString(*desiredStartupType);
    const bool changeRunState = desiredRunState.has_value()
        && before.status != toServiceStatusString(*desiredRunState);
    if (!changeStartup && !changeRunState) {
        TLOG_DEBUG(m_logger,
                   kComponent,
                   QStringLiteral("setService"),
                   QStringLiteral("service_already_in_state"),
                   QStringLiteral("idempotent_request"),
                   QStringLiteral("service_query"),
                   (nlohmann::json{{"service", name}, {"current", before}}));
        return MutationResult(std::optional<ChangeEntry>());
    }

    bool applied = false;
    std::string writeError;
    try {
        if (changeStartup) {
            m_services.setStartupType(name, *desiredStartupType);
            applied = true;
        }
        if (changeRunState) {
            if (*desiredRunState == ServiceStatus::Running) {
                m_services.start(name);
            } else {
                m_services.stop(name);
            }
            applied = true;
        }
    } catch (const std::exception &ex) {
        writeError = ex.what();
    }

    if (!writeError.empty() && !applied) {
        return fail(ErrorKind::StateWriteFailure, "setService", name, writeError);
    }

    ServiceStateSnapshot intended = before;
    if (changeStartup) {
        intended.startupType = toStartupTypeString(*desiredStartupType);
    }
    if (changeRunState) {
        intended.status = toServiceStatusString(*desiredRunState);
    }

    SnapshotValue after;
    std::string readError;
    try {
        after = SnapshotValue::fromService(m_services.query(name));
    } catch (const std::exception &ex) {
        readError = ex.what();
        after = SnapshotValue::fromService(intended);
    }

    // A partially applied change is journaled so that rollback can undo it.
    const std::string entryNote = readError.empty() ? note : unverifiedNote(note);
    MutationResult recorded = journal(category::Service, name,
                                      SnapshotValue::fromService(before), after, entryNote);
    if (!recorded.ok()) {
        return recorded;
    }
    if (!writeError.empty()) {
        return fail(ErrorKind::StateWriteFailure, "setService", name,
                    "partially applied: " + writeError, *recorded.value());
    }
    if (!readError.empty()) {
        return fail(ErrorKind::StateReadFailure, "setService", name,
                    "read-back failed: " + readError, *recorded.value());
    }
    return recorded;
}

MutationResult KeyValueMutators::setActivePowerScheme(const std::string &schemeGuid,
                                                      const std::string &note)
{
    return setSetting(m_powercfg, category::PowerCfg, kActiveSchemeKey, schemeGuid, note);
}

MutationResult KeyValueMutators::setBootOption(const std::string &element,
                                               const std::string &value,
                                               const std::string &note)
{
    return setSetting(m_bcdedit, category::BcdEdit, element, value, note);
}

MutationResult KeyValueMutators::setSetting(SettingStore &store,
                                            const char *category,
                                            const std::string &key,
                                            const std::string &value,
                                            const std::string &note)
{
    const std::string where = std::string("set:") + category;

    SnapshotValue before;
    try {
        before = store.read(key);
    } catch (const std::exception &ex) {
        return fail(ErrorKind::StateReadFailure, where, key, ex.what());
    }

    try {
        store.write(key, value);
    } catch (const std::exception &ex) {
        return fail(ErrorKind::StateWriteFailure, where, key, ex.what());
    }

    SnapshotValue after;
    try {
        after = store.read(key);
    } catch (const std::exception &ex) {
        MutationResult recorded = journal(category, key, before,
                                          SnapshotValue::fromString(value), unverifiedNote(note));
        if (!recorded.ok()) {
            return recorded;
        }
        return fail(ErrorKind::StateReadFailure, where, key,
                    std::string("read-back failed: ") + ex.what(), *recorded.value());
    }
    return journal(category, key, before, after, note);
}

} // namespace tunelog
