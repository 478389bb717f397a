#include "orchestrator/path_utils.hpp"

#include <vector>

#include <QDir>
#include <QFileInfo>

#ifdef Q_OS_WIN
#include <windows.h>
#endif

namespace tunelog {

namespace {

const QString kHostileCharacters = QStringLiteral(" \t&()[]{}^=;!'`+,$%@#~\"");

QString syncProviderFor(const QString &dirName)
{
    if (dirName.compare(QStringLiteral("OneDrive"), Qt::CaseInsensitive) == 0
        || dirName.startsWith(QStringLiteral("OneDrive - "), Qt::CaseInsensitive)) {
        return QStringLiteral("OneDrive");
    }
    if (dirName.compare(QStringLiteral("Dropbox"), Qt::CaseInsensitive) == 0
        || dirName.startsWith(QStringLiteral("Dropbox ("), Qt::CaseInsensitive)) {
        return QStringLiteral("Dropbox");
    }
    if (dirName.compare(QStringLiteral("iCloudDrive"), Qt::CaseInsensitive) == 0
        || dirName.compare(QStringLiteral("iCloud Drive"), Qt::CaseInsensitive) == 0
        || dirName.compare(QStringLiteral("Mobile Documents"), Qt::CaseInsensitive) == 0) {
        return QStringLiteral("iCloud");
    }
    if (dirName.compare(QStringLiteral("Google Drive"), Qt::CaseInsensitive) == 0
        || dirName.compare(QStringLiteral("GoogleDrive"), Qt::CaseInsensitive) == 0
        || dirName.compare(QStringLiteral("My Drive"), Qt::CaseInsensitive) == 0) {
        return QStringLiteral("Google Drive");
    }
    return QString();
}

#ifdef Q_OS_WIN
QString nativeShortPath(const QString &existingPath)
{
    const std::wstring longPath = QDir::toNativeSeparators(existingPath).toStdWString();
    const DWORD needed = GetShortPathNameW(longPath.c_str(), nullptr, 0);
    if (needed == 0) {
        return QString();
    }
    std::vector<wchar_t> buffer(needed);
    const DWORD written = GetShortPathNameW(longPath.c_str(), buffer.data(), needed);
    if (written == 0 || written >= needed) {
        return QString();
    }
    return QString::fromWCharArray(buffer.data(), static_cast<int>(written));
}
#endif

} // namespace

bool hasHostileCharacters(const QString &path)
{
    for (const QChar ch : path) {
        if (ch.unicode() < 0x20 || ch.unicode() > 0x7e || kHostileCharacters.contains(ch)) {
            return true;
        }
    }
    return false;
}

std::optional<SyncFolderInfo> findSyncFolder(const QString &path)
{
    if (path.isEmpty()) {
        return std::nullopt;
    }
    QString current = QDir::cleanPath(QFileInfo(path).absoluteFilePath());
    while (!current.isEmpty()) {
        const QString provider = syncProviderFor(QFileInfo(current).fileName());
        if (!provider.isEmpty()) {
            return SyncFolderInfo{provider, QDir::toNativeSeparators(current)};
        }
        const QString parent = QFileInfo(current).path();
        if (parent == current || parent == QStringLiteral(".")) {
            break;
        }
        current = parent;
    }
    return std::nullopt;
}

bool isPathLike(const QString &argument)
{
    if (argument.isEmpty()) {
        return false;
    }
    return QDir::isAbsolutePath(argument) || argument.contains(QLatin1Char('/'))
        || argument.contains(QLatin1Char('\\'));
}

QString shortPathName(const QString &path)
{
#ifdef Q_OS_WIN
    if (path.isEmpty()) {
        return path;
    }
    const QFileInfo info(path);
    if (info.exists()) {
        const QString shortened = nativeShortPath(info.absoluteFilePath());
        return shortened.isEmpty() ? path : shortened;
    }
    const QString parent = info.absolutePath();
    if (parent.isEmpty() || parent == info.absoluteFilePath()) {
        return path;
    }
    const QString shortParent = shortPathName(parent);
    if (shortParent == parent) {
        return path;
    }
    return QDir::toNativeSeparators(QDir(shortParent).filePath(info.fileName()));
#else
    return path;
#endif
}

QString normalizeArgument(const QString &argument)
{
    if (!isPathLike(argument)) {
        return argument;
    }
    if (!hasHostileCharacters(argument) && !findSyncFolder(argument).has_value()) {
        return argument;
    }
    return shortPathName(argument);
}

} // namespace tunelog
