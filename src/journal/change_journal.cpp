#include "journal/change_journal.hpp"

#include <chrono>
#include <unordered_map>
#include <utility>

namespace tunelog {

ChangeJournal::ChangeJournal(std::vector<ChangeEntry> entries)
    : m_entries(std::move(entries))
{
}

void ChangeJournal::setPersistHook(PersistHook hook)
{
    m_persist = std::move(hook);
}

ChangeEntry ChangeJournal::record(const std::string &category,
                                  const std::string &key,
                                  const SnapshotValue &before,
                                  const SnapshotValue &after,
                                  const std::string &note,
                                  std::optional<RegistryValueKind> beforeKind)
{
    ChangeEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.category = category;
    entry.key = key;
    entry.before = before;
    entry.after = after;
    entry.note = note;
    entry.beforeKind = beforeKind;

    m_entries.push_back(entry);

    // No batching: every append is durable before the caller moves on.
    if (m_persist) {
        m_persist(*this);
    }
    return entry;
}

std::vector<ChangeEntry> ChangeJournal::query(const RollbackFilter &filter) const
{
    std::vector<ChangeEntry> result;
    for (const auto &entry : m_entries) {
        if (filter.matches(entry)) {
            result.push_back(entry);
        }
    }
    return result;
}

std::vector<ChangeEntry> ChangeJournal::query(const std::vector<RollbackFilter> &filters) const
{
    if (filters.empty()) {
        return m_entries;
    }

    std::vector<ChangeEntry> result;
    for (const auto &entry : m_entries) {
        for (const auto &filter : filters) {
            if (filter.matches(entry)) {
                result.push_back(entry);
                break;
            }
        }
    }
    return result;
}

std::vector<ChangeEntry> ChangeJournal::latestPerKey(const RollbackFilter &filter) const
{
    std::unordered_map<std::string, std::size_t> lastIndex;
    for (std::size_t i = 0; i < m_entries.size(); ++i) {
        const auto &entry = m_entries[i];
        if (filter.matches(entry)) {
            lastIndex[entry.category + '\x1f' + entry.key] = i;
        }
    }

    std::vector<ChangeEntry> result;
    for (std::size_t i = 0; i < m_entries.size(); ++i) {
        const auto &entry = m_entries[i];
        const auto it = lastIndex.find(entry.category + '\x1f' + entry.key);
        if (it != lastIndex.end() && it->second == i) {
            result.push_back(entry);
        }
    }
    return result;
}

} // namespace tunelog
