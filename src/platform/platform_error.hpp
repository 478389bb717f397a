#pragma once

#include <stdexcept>
#include <string>

namespace tunelog {

enum class PlatformErrorKind {
    NotFound,
    PermissionDenied,
    CommandFailed,
    Unsupported
};

// Thrown by the registry, service and setting backends.
class PlatformError : public std::runtime_error {
public:
    PlatformError(PlatformErrorKind kind, const std::string &message)
        : std::runtime_error(message)
        , m_kind(kind)
    {
    }

    PlatformErrorKind kind() const { return m_kind; }

private:
    PlatformErrorKind m_kind;
};

inline const char *platformErrorKindName(PlatformErrorKind kind)
{
    switch (kind) {
    case PlatformErrorKind::NotFound:
        return "not_found";
    case PlatformErrorKind::PermissionDenied:
        return "permission_denied";
    case PlatformErrorKind::CommandFailed:
        return "command_failed";
    case PlatformErrorKind::Unsupported:
        return "unsupported";
    }
    return "command_failed";
}

} // namespace tunelog
