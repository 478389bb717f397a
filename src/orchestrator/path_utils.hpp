#pragma once

#include <optional>

#include <QString>

namespace tunelog {

struct SyncFolderInfo {
    QString provider; // "OneDrive", "Dropbox", "iCloud", "Google Drive"
    QString root;
};

// Characters that break interpreter argument parsing or quoting: whitespace,
// shell metacharacters and anything outside printable ASCII.
bool hasHostileCharacters(const QString &path);

// The nearest enclosing directory managed by a file-sync client, if any.
std::optional<SyncFolderInfo> findSyncFolder(const QString &path);

// Absolute or containing a separator.
bool isPathLike(const QString &argument);

// 8.3 alias of path. A path that does not exist yet gets its deepest existing
// ancestor shortened and the remainder appended. Returns path unchanged when
// no alias is available (always, outside Windows).
QString shortPathName(const QString &path);

// Path-like arguments with hostile characters or under a sync folder are
// replaced by their short alias when one resolves; everything else is
// returned as is.
QString normalizeArgument(const QString &argument);

} // namespace tunelog
