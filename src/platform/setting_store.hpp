#pragma once

#include <string>

#include <QString>

#include "common/models.hpp"

namespace tunelog::logging {
class Logger;
}

namespace tunelog {

// Opaque key/value settings owned by a system utility (power scheme, boot
// configuration). Implementations throw PlatformError.
class SettingStore {
public:
    virtual ~SettingStore() = default;

    // Absent when the setting is not present.
    virtual SnapshotValue read(const std::string &key) = 0;
    virtual void write(const std::string &key, const std::string &value) = 0;
    // Removing an absent setting is not an error.
    virtual void remove(const std::string &key) = 0;
};

// The active power scheme via powercfg. Only the "activeScheme" key exists.
class PowerCfgStore : public SettingStore {
public:
    explicit PowerCfgStore(logging::Logger &logger);

    SnapshotValue read(const std::string &key) override;
    void write(const std::string &key, const std::string &value) override;
    void remove(const std::string &key) override;

private:
    logging::Logger &m_logger;
};

// Boot configuration elements of one BCD entry via bcdedit.
class BcdEditStore : public SettingStore {
public:
    explicit BcdEditStore(logging::Logger &logger,
                          const QString &entry = QStringLiteral("{current}"));

    SnapshotValue read(const std::string &key) override;
    void write(const std::string &key, const std::string &value) override;
    void remove(const std::string &key) override;

private:
    logging::Logger &m_logger;
    QString m_entry;
};

} // namespace tunelog
