#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace tunelog {

// ChangeJournal is the append-only record of every mutation in a run.
// Entries are never edited or removed; a correction is a new entry.
class ChangeJournal {
public:
    using PersistHook = std::function<void(const ChangeJournal &)>;

    ChangeJournal() = default;
    explicit ChangeJournal(std::vector<ChangeEntry> entries);

    // Called after every append. A throwing hook makes record() throw.
    void setPersistHook(PersistHook hook);

    // Appends an entry stamped with the current time and persists the whole
    // journal. The entry stays in memory even if persisting fails.
    ChangeEntry record(const std::string &category,
                       const std::string &key,
                       const SnapshotValue &before,
                       const SnapshotValue &after,
                       const std::string &note,
                       std::optional<RegistryValueKind> beforeKind = std::nullopt);

    // Matching entries in insertion order.
    std::vector<ChangeEntry> query(const RollbackFilter &filter = {}) const;
    // Entries matching any of the filters, in insertion order, each once.
    std::vector<ChangeEntry> query(const std::vector<RollbackFilter> &filters) const;

    // Only the last matching entry per key, ordered by that entry's position.
    std::vector<ChangeEntry> latestPerKey(const RollbackFilter &filter = {}) const;

    const std::vector<ChangeEntry> &entries() const { return m_entries; }
    std::size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

private:
    std::vector<ChangeEntry> m_entries;
    PersistHook m_persist;
};

} // namespace tunelog
