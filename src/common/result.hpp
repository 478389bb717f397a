#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "common/models.hpp"

namespace tunelog {

enum class ErrorKind {
    MutatorFailure,
    TimeoutFailure,
    StateReadFailure,
    StateWriteFailure,
    JournalWriteFailure,
    RollbackTargetMissing
};

inline const char *errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::MutatorFailure:
        return "mutator_failure";
    case ErrorKind::TimeoutFailure:
        return "timeout_failure";
    case ErrorKind::StateReadFailure:
        return "state_read_failure";
    case ErrorKind::StateWriteFailure:
        return "state_write_failure";
    case ErrorKind::JournalWriteFailure:
        return "journal_write_failure";
    case ErrorKind::RollbackTargetMissing:
        return "rollback_target_missing";
    }
    return "mutator_failure";
}

struct Error {
    ErrorKind kind = ErrorKind::MutatorFailure;
    std::string message;
    // Set when the mutation reached the system and was journaled before the
    // failure was detected (e.g. read-back failed).
    std::optional<ChangeEntry> recorded;
};

// Value-or-error return used by the mutators.
template <typename T>
class Result {
public:
    Result(T value)
        : m_state(std::move(value))
    {
    }

    Result(Error error)
        : m_state(std::move(error))
    {
    }

    bool ok() const { return std::holds_alternative<T>(m_state); }
    explicit operator bool() const { return ok(); }

    const T &value() const
    {
        if (!ok()) {
            throw std::logic_error("Result::value() on error: " + error().message);
        }
        return std::get<T>(m_state);
    }

    const Error &error() const { return std::get<Error>(m_state); }

private:
    std::variant<T, Error> m_state;
};

// nullopt means the requested state was already in place and nothing was
// journaled.
using MutationResult = Result<std::optional<ChangeEntry>>;

} // namespace tunelog
