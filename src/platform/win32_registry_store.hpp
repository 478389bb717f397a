#pragma once

#include "platform/registry_store.hpp"

namespace tunelog {

// Native Windows registry through the Win32 API (64-bit view).
class Win32RegistryStore : public RegistryStore {
public:
    void ensureKey(const std::string &path) override;
    SnapshotValue read(const std::string &path, const std::string &name) const override;
    std::optional<RegistryValueKind> readKind(const std::string &path,
                                              const std::string &name) const override;
    void write(const std::string &path,
               const std::string &name,
               const SnapshotValue &value,
               RegistryValueKind kind) override;
    void remove(const std::string &path, const std::string &name) override;
};

} // namespace tunelog
