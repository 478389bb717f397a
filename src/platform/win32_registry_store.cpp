#include "platform/win32_registry_store.hpp"

#include <cstdint>
#include <cstring>
#include <vector>

#include <QString>

#include <windows.h>

#include "platform/platform_error.hpp"

namespace tunelog {

namespace {

struct SplitPath {
    HKEY root = nullptr;
    std::wstring subKey;
};

std::wstring toWide(const std::string &value)
{
    return QString::fromStdString(value).toStdWString();
}

std::string fromWide(const wchar_t *value, std::size_t length)
{
    return QString::fromWCharArray(value, static_cast<int>(length)).toStdString();
}

SplitPath splitPath(const std::string &path)
{
    const auto pos = path.find('\\');
    const std::string hive = pos == std::string::npos ? path : path.substr(0, pos);
    const std::string rest = pos == std::string::npos ? std::string() : path.substr(pos + 1);

    SplitPath split;
    const QString upper = QString::fromStdString(hive).toUpper();
    if (upper == QStringLiteral("HKLM") || upper == QStringLiteral("HKEY_LOCAL_MACHINE")) {
        split.root = HKEY_LOCAL_MACHINE;
    } else if (upper == QStringLiteral("HKCU") || upper == QStringLiteral("HKEY_CURRENT_USER")) {
        split.root = HKEY_CURRENT_USER;
    } else if (upper == QStringLiteral("HKCR") || upper == QStringLiteral("HKEY_CLASSES_ROOT")) {
        split.root = HKEY_CLASSES_ROOT;
    } else if (upper == QStringLiteral("HKU") || upper == QStringLiteral("HKEY_USERS")) {
        split.root = HKEY_USERS;
    } else {
        throw PlatformError(PlatformErrorKind::NotFound, "unknown registry hive: " + hive);
    }
    split.subKey = toWide(rest);
    return split;
}

[[noreturn]] void throwForStatus(LONG status, const std::string &what)
{
    if (status == ERROR_ACCESS_DENIED) {
        throw PlatformError(PlatformErrorKind::PermissionDenied, what + ": access denied");
    }
    if (status == ERROR_FILE_NOT_FOUND || status == ERROR_PATH_NOT_FOUND) {
        throw PlatformError(PlatformErrorKind::NotFound, what + ": not found");
    }
    throw PlatformError(PlatformErrorKind::CommandFailed,
                        what + ": error " + std::to_string(status));
}

class KeyHandle {
public:
    KeyHandle() = default;
    ~KeyHandle()
    {
        if (m_key) {
            RegCloseKey(m_key);
        }
    }
    KeyHandle(const KeyHandle &) = delete;
    KeyHandle &operator=(const KeyHandle &) = delete;

    HKEY *out() { return &m_key; }
    HKEY get() const { return m_key; }

private:
    HKEY m_key = nullptr;
};

} // namespace

void Win32RegistryStore::ensureKey(const std::string &path)
{
    const SplitPath split = splitPath(path);
    KeyHandle key;
    DWORD disposition = 0;
    const LONG status = RegCreateKeyExW(split.root, split.subKey.c_str(), 0, nullptr,
                                        REG_OPTION_NON_VOLATILE,
                                        KEY_WRITE | KEY_WOW64_64KEY, nullptr,
                                        key.out(), &disposition);
    if (status != ERROR_SUCCESS) {
        throwForStatus(status, "create key " + path);
    }
}

SnapshotValue Win32RegistryStore::read(const std::string &path, const std::string &name) const
{
    const SplitPath split = splitPath(path);
    KeyHandle key;
    LONG status = RegOpenKeyExW(split.root, split.subKey.c_str(), 0,
                                KEY_QUERY_VALUE | KEY_WOW64_64KEY, key.out());
    if (status == ERROR_FILE_NOT_FOUND || status == ERROR_PATH_NOT_FOUND) {
        return SnapshotValue::absent();
    }
    if (status != ERROR_SUCCESS) {
        throwForStatus(status, "open key " + path);
    }

    const std::wstring valueName = toWide(name);
    DWORD type = 0;
    DWORD size = 0;
    status = RegQueryValueExW(key.get(), valueName.c_str(), nullptr, &type, nullptr, &size);
    if (status == ERROR_FILE_NOT_FOUND) {
        return SnapshotValue::absent();
    }
    if (status != ERROR_SUCCESS) {
        throwForStatus(status, "query " + registryJournalKey(path, name));
    }

    std::vector<BYTE> buffer(size + sizeof(wchar_t));
    status = RegQueryValueExW(key.get(), valueName.c_str(), nullptr, &type,
                              buffer.data(), &size);
    if (status != ERROR_SUCCESS) {
        throwForStatus(status, "read " + registryJournalKey(path, name));
    }

    switch (type) {
    case REG_DWORD: {
        DWORD value = 0;
        memcpy(&value, buffer.data(), sizeof(value));
        return SnapshotValue::fromInt(static_cast<std::int64_t>(value));
    }
    case REG_QWORD: {
        ULONGLONG value = 0;
        memcpy(&value, buffer.data(), sizeof(value));
        return SnapshotValue::fromInt(static_cast<std::int64_t>(value));
    }
    case REG_SZ:
    case REG_EXPAND_SZ: {
        const auto *text = reinterpret_cast<const wchar_t *>(buffer.data());
        std::size_t length = size / sizeof(wchar_t);
        while (length > 0 && text[length - 1] == L'\0') {
            --length;
        }
        return SnapshotValue::fromString(fromWide(text, length));
    }
    default:
        throw PlatformError(PlatformErrorKind::Unsupported,
                            "unsupported registry type for " + registryJournalKey(path, name));
    }
}

std::optional<RegistryValueKind> Win32RegistryStore::readKind(const std::string &path,
                                                              const std::string &name) const
{
    const SplitPath split = splitPath(path);
    KeyHandle key;
    LONG status = RegOpenKeyExW(split.root, split.subKey.c_str(), 0,
                                KEY_QUERY_VALUE | KEY_WOW64_64KEY, key.out());
    if (status == ERROR_FILE_NOT_FOUND || status == ERROR_PATH_NOT_FOUND) {
        return std::nullopt;
    }
    if (status != ERROR_SUCCESS) {
        throwForStatus(status, "open key " + path);
    }

    DWORD type = 0;
    status = RegQueryValueExW(key.get(), toWide(name).c_str(), nullptr, &type, nullptr, nullptr);
    if (status == ERROR_FILE_NOT_FOUND) {
        return std::nullopt;
    }
    if (status != ERROR_SUCCESS) {
        throwForStatus(status, "query " + registryJournalKey(path, name));
    }

    switch (type) {
    case REG_DWORD:
        return RegistryValueKind::DWord;
    case REG_QWORD:
        return RegistryValueKind::QWord;
    case REG_SZ:
        return RegistryValueKind::String;
    case REG_EXPAND_SZ:
        return RegistryValueKind::ExpandString;
    default:
        throw PlatformError(PlatformErrorKind::Unsupported,
                            "unsupported registry type for " + registryJournalKey(path, name));
    }
}

void Win32RegistryStore::write(const std::string &path,
                               const std::string &name,
                               const SnapshotValue &value,
                               RegistryValueKind kind)
{
    const SplitPath split = splitPath(path);
    KeyHandle key;
    LONG status = RegOpenKeyExW(split.root, split.subKey.c_str(), 0,
                                KEY_SET_VALUE | KEY_WOW64_64KEY, key.out());
    if (status != ERROR_SUCCESS) {
        throwForStatus(status, "open key " + path);
    }

    const std::wstring valueName = toWide(name);
    switch (kind) {
    case RegistryValueKind::DWord: {
        if (!value.isInt()) {
            throw PlatformError(PlatformErrorKind::Unsupported, "dword write needs an integer");
        }
        const DWORD data = static_cast<DWORD>(value.asInt());
        status = RegSetValueExW(key.get(), valueName.c_str(), 0, REG_DWORD,
                                reinterpret_cast<const BYTE *>(&data), sizeof(data));
        break;
    }
    case RegistryValueKind::QWord: {
        if (!value.isInt()) {
            throw PlatformError(PlatformErrorKind::Unsupported, "qword write needs an integer");
        }
        const ULONGLONG data = static_cast<ULONGLONG>(value.asInt());
        status = RegSetValueExW(key.get(), valueName.c_str(), 0, REG_QWORD,
                                reinterpret_cast<const BYTE *>(&data), sizeof(data));
        break;
    }
    case RegistryValueKind::String:
    case RegistryValueKind::ExpandString: {
        const std::wstring data = toWide(value.isInt() ? std::to_string(value.asInt())
                                                       : value.asString());
        const DWORD type = kind == RegistryValueKind::String ? REG_SZ : REG_EXPAND_SZ;
        status = RegSetValueExW(key.get(), valueName.c_str(), 0, type,
                                reinterpret_cast<const BYTE *>(data.c_str()),
                                static_cast<DWORD>((data.size() + 1) * sizeof(wchar_t)));
        break;
    }
    }

    if (status != ERROR_SUCCESS) {
        throwForStatus(status, "write " + registryJournalKey(path, name));
    }
}

void Win32RegistryStore::remove(const std::string &path, const std::string &name)
{
    const SplitPath split = splitPath(path);
    KeyHandle key;
    LONG status = RegOpenKeyExW(split.root, split.subKey.c_str(), 0,
                                KEY_SET_VALUE | KEY_WOW64_64KEY, key.out());
    if (status == ERROR_FILE_NOT_FOUND || status == ERROR_PATH_NOT_FOUND) {
        return;
    }
    if (status != ERROR_SUCCESS) {
        throwForStatus(status, "open key " + path);
    }

    status = RegDeleteValueW(key.get(), toWide(name).c_str());
    if (status != ERROR_SUCCESS && status != ERROR_FILE_NOT_FOUND) {
        throwForStatus(status, "delete " + registryJournalKey(path, name));
    }
}

} // namespace tunelog
