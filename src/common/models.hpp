#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace tunelog {

namespace category {
inline constexpr const char *Registry = "registry";
inline constexpr const char *Service = "service";
inline constexpr const char *PowerCfg = "powercfg";
inline constexpr const char *BcdEdit = "bcdedit";
} // namespace category

inline constexpr const char *kActiveSchemeKey = "activeScheme";

// Opaque payload for category "service". Both fields keep the platform's
// textual form so that an unknown value survives a load/persist cycle.
struct ServiceStateSnapshot {
    std::string status;
    std::string startupType;

    bool operator==(const ServiceStateSnapshot &other) const
    {
        return status == other.status && startupType == other.startupType;
    }
    bool operator!=(const ServiceStateSnapshot &other) const
    {
        return !(*this == other);
    }
};

// Tagged union for journal before/after values.
// Absent means the value did not exist.
class SnapshotValue {
public:
    SnapshotValue() = default;

    static SnapshotValue absent() { return SnapshotValue(); }
    static SnapshotValue fromInt(std::int64_t value);
    static SnapshotValue fromString(std::string value);
    static SnapshotValue fromService(ServiceStateSnapshot value);

    bool isAbsent() const { return std::holds_alternative<std::monostate>(m_value); }
    bool isInt() const { return std::holds_alternative<std::int64_t>(m_value); }
    bool isString() const { return std::holds_alternative<std::string>(m_value); }
    bool isService() const { return std::holds_alternative<ServiceStateSnapshot>(m_value); }

    std::int64_t asInt() const { return std::get<std::int64_t>(m_value); }
    const std::string &asString() const { return std::get<std::string>(m_value); }
    const ServiceStateSnapshot &asService() const { return std::get<ServiceStateSnapshot>(m_value); }

    // Human readable rendering for logs and reports.
    std::string display() const;

    bool operator==(const SnapshotValue &other) const { return m_value == other.m_value; }
    bool operator!=(const SnapshotValue &other) const { return !(*this == other); }

private:
    std::variant<std::monostate, std::int64_t, std::string, ServiceStateSnapshot> m_value;
};

inline SnapshotValue SnapshotValue::fromInt(std::int64_t value)
{
    SnapshotValue result;
    result.m_value = value;
    return result;
}

inline SnapshotValue SnapshotValue::fromString(std::string value)
{
    SnapshotValue result;
    result.m_value = std::move(value);
    return result;
}

inline SnapshotValue SnapshotValue::fromService(ServiceStateSnapshot value)
{
    SnapshotValue result;
    result.m_value = std::move(value);
    return result;
}

inline std::string SnapshotValue::display() const
{
    if (isAbsent()) {
        return "<absent>";
    }
    if (isInt()) {
        return std::to_string(asInt());
    }
    if (isString()) {
        return asString();
    }
    const auto &service = asService();
    return service.status + "/" + service.startupType;
}

struct ChangeEntry {
    std::chrono::system_clock::time_point timestamp;
    std::string category;
    std::string key;
    SnapshotValue before;
    SnapshotValue after;
    std::string note;
    // Registry type of the value before the change; unset when it was absent
    // or for other categories.
    std::optional<RegistryValueKind> beforeKind;
};

// Selects a subset of a journal. Empty fields match everything.
struct RollbackFilter {
    std::string category;
    std::string keyPrefix;

    bool matches(const ChangeEntry &entry) const
    {
        if (!category.empty() && entry.category != category) {
            return false;
        }
        return entry.key.compare(0, keyPrefix.size(), keyPrefix) == 0;
    }
};

struct OptInSpec {
    std::string flag;
    std::string prompt;
};

// One step of the Apply or Rollback pipeline.
struct PhaseSpec {
    std::string name;
    std::string title;
    RunnerKind runner = RunnerKind::Native;
    std::string program;
    std::vector<std::string> args;
    std::string profile;
    int timeoutMs = 0;
    bool advisory = false;
    std::string confirm;
    std::vector<OptInSpec> optIns;
};

struct PhaseResult {
    std::string name;
    PhaseState state = PhaseState::NotStarted;
    int exitCode = 0;
    std::chrono::system_clock::time_point startedAt;
    std::chrono::milliseconds duration{0};
    std::string message;
};

struct PipelineResult {
    RunMode mode = RunMode::Apply;
    bool succeeded = false;
    bool cancelled = false;
    std::vector<PhaseResult> phases;
    std::string haltedAt;
};

struct RunRecord {
    std::string runId;
    RunMode mode = RunMode::Apply;
    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point finishedAt;
    std::string status;
    std::string contextFile;
    std::string logFile;
    std::string rollbackTarget;
    int changeCount = 0;
};

} // namespace tunelog
