#include "platform/simulated_backends.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSettings>

#include "common/json_utils.hpp"
#include "platform/platform_error.hpp"

namespace tunelog {

namespace {

std::unique_ptr<QSettings> openState(const QString &statePath)
{
    QDir().mkpath(QFileInfo(statePath).absolutePath());
    return std::make_unique<QSettings>(statePath, QSettings::IniFormat);
}

void syncOrThrow(QSettings &settings, const std::string &what)
{
    settings.sync();
    if (settings.status() == QSettings::AccessError) {
        throw PlatformError(PlatformErrorKind::PermissionDenied, what + ": state file not writable");
    }
    if (settings.status() == QSettings::FormatError) {
        throw PlatformError(PlatformErrorKind::CommandFailed, what + ": state file malformed");
    }
}

void requireWritable(const QSettings &settings, const std::string &what)
{
    if (!settings.isWritable()) {
        throw PlatformError(PlatformErrorKind::PermissionDenied, what + ": state file not writable");
    }
}

QString registryGroup(const std::string &path)
{
    QString group = QString::fromStdString(path);
    group.replace(QLatin1Char('\\'), QLatin1Char('/'));
    return QStringLiteral("registry/") + group;
}

QString registryKey(const std::string &path, const std::string &name)
{
    return registryGroup(path) + QLatin1Char('/') + QString::fromStdString(name);
}

QString encodeRegistryValue(const SnapshotValue &value, RegistryValueKind kind)
{
    const QString prefix = QString::fromStdString(toRegistryKindString(kind)) + QLatin1Char(':');
    switch (kind) {
    case RegistryValueKind::DWord:
        if (!value.isInt()) {
            throw PlatformError(PlatformErrorKind::Unsupported, "dword write needs an integer");
        }
        return prefix + QString::number(static_cast<quint32>(value.asInt()));
    case RegistryValueKind::QWord:
        if (!value.isInt()) {
            throw PlatformError(PlatformErrorKind::Unsupported, "qword write needs an integer");
        }
        return prefix + QString::number(static_cast<qint64>(value.asInt()));
    case RegistryValueKind::String:
    case RegistryValueKind::ExpandString:
        return prefix + QString::fromStdString(value.isInt() ? std::to_string(value.asInt())
                                                             : value.asString());
    }
    return prefix;
}

SnapshotValue decodeRegistryValue(const QString &stored)
{
    const int colon = stored.indexOf(QLatin1Char(':'));
    if (colon <= 0) {
        return SnapshotValue::fromString(stored.toStdString());
    }
    const auto kind = parseRegistryKindString(stored.left(colon).toStdString());
    const QString payload = stored.mid(colon + 1);
    if (!kind.has_value()) {
        return SnapshotValue::fromString(stored.toStdString());
    }
    if (*kind == RegistryValueKind::DWord || *kind == RegistryValueKind::QWord) {
        bool ok = false;
        const qint64 number = payload.toLongLong(&ok);
        if (ok) {
            return SnapshotValue::fromInt(number);
        }
    }
    return SnapshotValue::fromString(payload.toStdString());
}

} // namespace

IniRegistryStore::IniRegistryStore(const QString &statePath)
    : m_settings(openState(statePath))
{
}

IniRegistryStore::~IniRegistryStore() = default;

void IniRegistryStore::ensureKey(const std::string &path)
{
    // INI files have no empty groups; the group appears with its first value.
    requireWritable(*m_settings, "create key " + path);
}

SnapshotValue IniRegistryStore::read(const std::string &path, const std::string &name) const
{
    const QString key = registryKey(path, name);
    if (!m_settings->contains(key)) {
        return SnapshotValue::absent();
    }
    return decodeRegistryValue(m_settings->value(key).toString());
}

std::optional<RegistryValueKind> IniRegistryStore::readKind(const std::string &path,
                                                            const std::string &name) const
{
    const QString key = registryKey(path, name);
    if (!m_settings->contains(key)) {
        return std::nullopt;
    }
    const QString stored = m_settings->value(key).toString();
    const int colon = stored.indexOf(QLatin1Char(':'));
    if (colon <= 0) {
        return RegistryValueKind::String;
    }
    return parseRegistryKindString(stored.left(colon).toStdString())
        .value_or(RegistryValueKind::String);
}

void IniRegistryStore::write(const std::string &path,
                             const std::string &name,
                             const SnapshotValue &value,
                             RegistryValueKind kind)
{
    const std::string what = "write " + registryJournalKey(path, name);
    requireWritable(*m_settings, what);
    m_settings->setValue(registryKey(path, name), encodeRegistryValue(value, kind));
    syncOrThrow(*m_settings, what);
}

void IniRegistryStore::remove(const std::string &path, const std::string &name)
{
    const QString key = registryKey(path, name);
    if (!m_settings->contains(key)) {
        return;
    }
    const std::string what = "delete " + registryJournalKey(path, name);
    requireWritable(*m_settings, what);
    m_settings->remove(key);
    syncOrThrow(*m_settings, what);
}

IniServiceManager::IniServiceManager(const QString &statePath)
    : m_settings(openState(statePath))
{
}

IniServiceManager::~IniServiceManager() = default;

ServiceStateSnapshot IniServiceManager::query(const std::string &name)
{
    const QString base = QStringLiteral("services/") + QString::fromStdString(name);
    ServiceStateSnapshot snapshot;
    snapshot.status = m_settings
                          ->value(base + QStringLiteral("/status"),
                                  QString::fromStdString(toServiceStatusString(ServiceStatus::Stopped)))
                          .toString()
                          .toStdString();
    snapshot.startupType = m_settings
                               ->value(base + QStringLiteral("/startupType"),
                                       QString::fromStdString(toStartupTypeString(StartupType::Manual)))
                               .toString()
                               .toStdString();
    return snapshot;
}

void IniServiceManager::setValue(const std::string &name, const char *field, const std::string &value)
{
    const std::string what = std::string("set ") + field + " of " + name;
    requireWritable(*m_settings, what);
    m_settings->setValue(QStringLiteral("services/%1/%2")
                             .arg(QString::fromStdString(name), QString::fromLatin1(field)),
                         QString::fromStdString(value));
    syncOrThrow(*m_settings, what);
}

void IniServiceManager::setStartupType(const std::string &name, StartupType type)
{
    setValue(name, "startupType", toStartupTypeString(type));
}

void IniServiceManager::start(const std::string &name)
{
    setValue(name, "status", toServiceStatusString(ServiceStatus::Running));
}

void IniServiceManager::stop(const std::string &name)
{
    setValue(name, "status", toServiceStatusString(ServiceStatus::Stopped));
}

IniSettingStore::IniSettingStore(const QString &statePath, const std::string &category)
    : m_settings(openState(statePath))
    , m_category(category)
{
}

IniSettingStore::~IniSettingStore() = default;

QString IniSettingStore::settingKey(const std::string &key) const
{
    return QStringLiteral("settings/%1/%2")
        .arg(QString::fromStdString(m_category), QString::fromStdString(key));
}

SnapshotValue IniSettingStore::read(const std::string &key)
{
    const QString settingPath = settingKey(key);
    if (!m_settings->contains(settingPath)) {
        return SnapshotValue::absent();
    }
    return SnapshotValue::fromString(m_settings->value(settingPath).toString().toStdString());
}

void IniSettingStore::write(const std::string &key, const std::string &value)
{
    const std::string what = "set " + m_category + "/" + key;
    requireWritable(*m_settings, what);
    m_settings->setValue(settingKey(key), QString::fromStdString(value));
    syncOrThrow(*m_settings, what);
}

void IniSettingStore::remove(const std::string &key)
{
    const QString settingPath = settingKey(key);
    if (!m_settings->contains(settingPath)) {
        return;
    }
    const std::string what = "delete " + m_category + "/" + key;
    requireWritable(*m_settings, what);
    m_settings->remove(settingPath);
    syncOrThrow(*m_settings, what);
}

} // namespace tunelog
