#pragma once

#include <memory>
#include <string>

#include <QString>

#include "platform/registry_store.hpp"
#include "platform/service_manager.hpp"
#include "platform/setting_store.hpp"

class QSettings;

namespace tunelog {

// QSettings INI stand-ins for hosts without the native facility. Each class
// owns one section of a shared state file:
//   registry/<path>/<name>        "<kind>:<value>"
//   services/<name>/status|startupType
//   settings/<category>/<key>

class IniRegistryStore : public RegistryStore {
public:
    explicit IniRegistryStore(const QString &statePath);
    ~IniRegistryStore() override;

    void ensureKey(const std::string &path) override;
    SnapshotValue read(const std::string &path, const std::string &name) const override;
    std::optional<RegistryValueKind> readKind(const std::string &path,
                                              const std::string &name) const override;
    void write(const std::string &path,
               const std::string &name,
               const SnapshotValue &value,
               RegistryValueKind kind) override;
    void remove(const std::string &path, const std::string &name) override;

private:
    std::unique_ptr<QSettings> m_settings;
};

// Unknown services read as Stopped/Manual.
class IniServiceManager : public ServiceManager {
public:
    explicit IniServiceManager(const QString &statePath);
    ~IniServiceManager() override;

    ServiceStateSnapshot query(const std::string &name) override;
    void setStartupType(const std::string &name, StartupType type) override;
    void start(const std::string &name) override;
    void stop(const std::string &name) override;

private:
    void setValue(const std::string &name, const char *field, const std::string &value);

    std::unique_ptr<QSettings> m_settings;
};

class IniSettingStore : public SettingStore {
public:
    IniSettingStore(const QString &statePath, const std::string &category);
    ~IniSettingStore() override;

    SnapshotValue read(const std::string &key) override;
    void write(const std::string &key, const std::string &value) override;
    void remove(const std::string &key) override;

private:
    QString settingKey(const std::string &key) const;

    std::unique_ptr<QSettings> m_settings;
    std::string m_category;
};

} // namespace tunelog
