#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace tunelog {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
#if defined(_WIN32)
    std::time_t time = _mkgmtime(&tm);
#else
    std::time_t time = timegm(&tm);
#endif
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline std::string toModeString(RunMode mode)
{
    switch (mode) {
    case RunMode::Apply:
        return "Apply";
    case RunMode::Rollback:
        return "Rollback";
    }
    return "Apply";
}

inline std::optional<RunMode> parseModeString(const std::string &value)
{
    if (value == "Apply" || value == "apply") {
        return RunMode::Apply;
    }
    if (value == "Rollback" || value == "rollback") {
        return RunMode::Rollback;
    }
    return std::nullopt;
}

inline std::string toPhaseStateString(PhaseState state)
{
    switch (state) {
    case PhaseState::NotStarted:
        return "not_started";
    case PhaseState::Running:
        return "running";
    case PhaseState::Succeeded:
        return "succeeded";
    case PhaseState::Failed:
        return "failed";
    case PhaseState::TimedOut:
        return "timed_out";
    }
    return "not_started";
}

inline PhaseState parsePhaseStateString(const std::string &value)
{
    if (value == "running") {
        return PhaseState::Running;
    }
    if (value == "succeeded") {
        return PhaseState::Succeeded;
    }
    if (value == "failed") {
        return PhaseState::Failed;
    }
    if (value == "timed_out") {
        return PhaseState::TimedOut;
    }
    return PhaseState::NotStarted;
}

inline std::string toServiceStatusString(ServiceStatus status)
{
    switch (status) {
    case ServiceStatus::Running:
        return "Running";
    case ServiceStatus::Stopped:
        return "Stopped";
    case ServiceStatus::Paused:
        return "Paused";
    case ServiceStatus::StartPending:
        return "StartPending";
    case ServiceStatus::StopPending:
        return "StopPending";
    case ServiceStatus::Unknown:
        return "Unknown";
    }
    return "Unknown";
}

inline ServiceStatus parseServiceStatusString(const std::string &value)
{
    if (value == "Running") {
        return ServiceStatus::Running;
    }
    if (value == "Stopped") {
        return ServiceStatus::Stopped;
    }
    if (value == "Paused") {
        return ServiceStatus::Paused;
    }
    if (value == "StartPending") {
        return ServiceStatus::StartPending;
    }
    if (value == "StopPending") {
        return ServiceStatus::StopPending;
    }
    return ServiceStatus::Unknown;
}

inline std::string toStartupTypeString(StartupType type)
{
    switch (type) {
    case StartupType::Automatic:
        return "Automatic";
    case StartupType::AutomaticDelayed:
        return "AutomaticDelayed";
    case StartupType::Manual:
        return "Manual";
    case StartupType::Disabled:
        return "Disabled";
    case StartupType::Boot:
        return "Boot";
    case StartupType::System:
        return "System";
    }
    return "Manual";
}

// No fallback here: callers decide what an unknown value means.
inline std::optional<StartupType> parseStartupTypeString(const std::string &value)
{
    if (value == "Automatic" || value == "Auto") {
        return StartupType::Automatic;
    }
    if (value == "AutomaticDelayed" || value == "AutomaticDelayedStart") {
        return StartupType::AutomaticDelayed;
    }
    if (value == "Manual") {
        return StartupType::Manual;
    }
    if (value == "Disabled") {
        return StartupType::Disabled;
    }
    if (value == "Boot") {
        return StartupType::Boot;
    }
    if (value == "System") {
        return StartupType::System;
    }
    return std::nullopt;
}

inline std::string toRegistryKindString(RegistryValueKind kind)
{
    switch (kind) {
    case RegistryValueKind::DWord:
        return "dword";
    case RegistryValueKind::QWord:
        return "qword";
    case RegistryValueKind::String:
        return "string";
    case RegistryValueKind::ExpandString:
        return "expand_string";
    }
    return "string";
}

inline std::optional<RegistryValueKind> parseRegistryKindString(const std::string &value)
{
    if (value == "dword") {
        return RegistryValueKind::DWord;
    }
    if (value == "qword") {
        return RegistryValueKind::QWord;
    }
    if (value == "string" || value == "sz") {
        return RegistryValueKind::String;
    }
    if (value == "expand_string" || value == "expand_sz") {
        return RegistryValueKind::ExpandString;
    }
    return std::nullopt;
}

inline void to_json(nlohmann::json &j, const ServiceStateSnapshot &snapshot)
{
    j = nlohmann::json{{"status", snapshot.status}, {"startupType", snapshot.startupType}};
}

inline void from_json(const nlohmann::json &j, ServiceStateSnapshot &snapshot)
{
    snapshot.status = j.value("status", "");
    snapshot.startupType = j.value("startupType", "");
}

// null, number, string or {status, startupType}.
inline void to_json(nlohmann::json &j, const SnapshotValue &value)
{
    if (value.isAbsent()) {
        j = nullptr;
    } else if (value.isInt()) {
        j = value.asInt();
    } else if (value.isString()) {
        j = value.asString();
    } else {
        j = value.asService();
    }
}

inline void from_json(const nlohmann::json &j, SnapshotValue &value)
{
    if (j.is_number_integer()) {
        value = SnapshotValue::fromInt(j.get<std::int64_t>());
    } else if (j.is_number()) {
        value = SnapshotValue::fromInt(static_cast<std::int64_t>(j.get<double>()));
    } else if (j.is_string()) {
        value = SnapshotValue::fromString(j.get<std::string>());
    } else if (j.is_object() && j.contains("startupType")) {
        value = SnapshotValue::fromService(j.get<ServiceStateSnapshot>());
    } else if (j.is_null()) {
        value = SnapshotValue::absent();
    } else {
        // Only null means "did not exist"; anything else unreadable must not turn into a delete.
        throw std::invalid_argument("unrecognized snapshot value: " + j.dump());
    }
}

inline void to_json(nlohmann::json &j, const ChangeEntry &entry)
{
    j = nlohmann::json{
        {"timestamp", toIso8601Utc(entry.timestamp)},
        {"category", entry.category},
        {"key", entry.key},
        {"before", entry.before},
        {"after", entry.after},
        {"note", entry.note}
    };
    if (entry.beforeKind.has_value()) {
        j["beforeKind"] = toRegistryKindString(*entry.beforeKind);
    }
}

inline void from_json(const nlohmann::json &j, ChangeEntry &entry)
{
    entry.timestamp = fromIso8601Utc(j.value("timestamp", ""));
    entry.category = j.value("category", "");
    entry.key = j.value("key", "");
    if (!j.contains("before")) {
        throw std::invalid_argument("change entry without \"before\": " + entry.key);
    }
    entry.before = j.at("before").get<SnapshotValue>();
    if (j.contains("after")) {
        entry.after = j.at("after").get<SnapshotValue>();
    } else {
        entry.after = SnapshotValue::absent();
    }
    entry.note = j.value("note", "");
    entry.beforeKind.reset();
    if (j.contains("beforeKind")) {
        entry.beforeKind = parseRegistryKindString(j.at("beforeKind").get<std::string>());
        if (!entry.beforeKind.has_value()) {
            throw std::invalid_argument("unknown registry kind for " + entry.key);
        }
    }
}

inline void to_json(nlohmann::json &j, const RollbackFilter &filter)
{
    j = nlohmann::json{{"category", filter.category}, {"keyPrefix", filter.keyPrefix}};
}

inline void from_json(const nlohmann::json &j, RollbackFilter &filter)
{
    filter.category = j.value("category", "");
    filter.keyPrefix = j.value("keyPrefix", "");
}

inline void to_json(nlohmann::json &j, const OptInSpec &optIn)
{
    j = nlohmann::json{{"flag", optIn.flag}, {"prompt", optIn.prompt}};
}

inline void from_json(const nlohmann::json &j, OptInSpec &optIn)
{
    optIn.flag = j.value("flag", "");
    optIn.prompt = j.value("prompt", "");
}

inline void to_json(nlohmann::json &j, const PhaseSpec &phase)
{
    j = nlohmann::json{
        {"name", phase.name},
        {"title", phase.title},
        {"runner", phase.runner == RunnerKind::PowerShell ? "powershell" : "native"},
        {"program", phase.program},
        {"args", phase.args},
        {"profile", phase.profile},
        {"timeoutMs", phase.timeoutMs},
        {"advisory", phase.advisory},
        {"confirm", phase.confirm},
        {"optIns", phase.optIns}
    };
}

inline void from_json(const nlohmann::json &j, PhaseSpec &phase)
{
    phase.name = j.value("name", "");
    phase.title = j.value("title", phase.name);
    phase.runner = j.value("runner", "native") == "powershell"
        ? RunnerKind::PowerShell
        : RunnerKind::Native;
    phase.program = j.value("program", "");
    if (j.contains("args") && j.at("args").is_array()) {
        phase.args = j.at("args").get<std::vector<std::string>>();
    } else {
        phase.args.clear();
    }
    phase.profile = j.value("profile", "");
    phase.timeoutMs = j.value("timeoutMs", 0);
    phase.advisory = j.value("advisory", false);
    phase.confirm = j.value("confirm", "");
    if (j.contains("optIns") && j.at("optIns").is_array()) {
        phase.optIns = j.at("optIns").get<std::vector<OptInSpec>>();
    } else {
        phase.optIns.clear();
    }
}

inline void to_json(nlohmann::json &j, const PhaseResult &result)
{
    j = nlohmann::json{
        {"name", result.name},
        {"state", toPhaseStateString(result.state)},
        {"exitCode", result.exitCode},
        {"startedAt", toIso8601Utc(result.startedAt)},
        {"durationMs", result.duration.count()},
        {"message", result.message}
    };
}

inline void to_json(nlohmann::json &j, const RunRecord &record)
{
    j = nlohmann::json{
        {"runId", record.runId},
        {"mode", toModeString(record.mode)},
        {"startedAt", toIso8601Utc(record.startedAt)},
        {"finishedAt", toIso8601Utc(record.finishedAt)},
        {"status", record.status},
        {"contextFile", record.contextFile},
        {"logFile", record.logFile},
        {"rollbackTarget", record.rollbackTarget},
        {"changeCount", record.changeCount}
    };
}

} // namespace tunelog
