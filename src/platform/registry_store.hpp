#pragma once

#include <optional>
#include <string>
#include <utility>

#include "common/enums.hpp"
#include "common/models.hpp"

namespace tunelog {

// Access to registry values. Paths use the "HKLM\SOFTWARE\..." form.
// Implementations throw PlatformError.
class RegistryStore {
public:
    virtual ~RegistryStore() = default;

    // Creates the key if it does not exist.
    virtual void ensureKey(const std::string &path) = 0;

    // Absent when the value (or its key) does not exist. Integer kinds come
    // back as Int, string kinds as String.
    virtual SnapshotValue read(const std::string &path, const std::string &name) const = 0;

    // Stored type of the value; nullopt when it does not exist.
    virtual std::optional<RegistryValueKind> readKind(const std::string &path,
                                                      const std::string &name) const = 0;

    virtual void write(const std::string &path,
                       const std::string &name,
                       const SnapshotValue &value,
                       RegistryValueKind kind) = 0;

    // Removing a value that does not exist is not an error.
    virtual void remove(const std::string &path, const std::string &name) = 0;
};

// Journal key for a registry value: "<path>\<name>".
inline std::string registryJournalKey(const std::string &path, const std::string &name)
{
    return path + "\\" + name;
}

// Inverse of registryJournalKey; splits on the last backslash, so value
// names must not contain one.
inline std::pair<std::string, std::string> splitRegistryJournalKey(const std::string &key)
{
    const auto pos = key.rfind('\\');
    if (pos == std::string::npos) {
        return {std::string(), key};
    }
    return {key.substr(0, pos), key.substr(pos + 1)};
}

} // namespace tunelog
