#pragma once

#include <optional>
#include <string>
#include <vector>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"
#include "common/models.hpp"

namespace tunelog {

enum class ActionType {
    Registry,
    Service,
    PowerCfg,
    BcdEdit
};

// One change a phase makes. Which fields are used depends on the type.
struct ProfileAction {
    ActionType type = ActionType::Registry;
    std::string note;
    // Runs only when this opt-in flag was passed as true.
    std::string optIn;
    bool continueOnError = false;

    // registry
    std::string path;
    std::string name;
    RegistryValueKind kind = RegistryValueKind::DWord;
    SnapshotValue value;

    // service (name above holds the service name)
    std::optional<StartupType> startupType;
    std::optional<ServiceStatus> runState;

    // powercfg: scheme GUID in settingValue; bcdedit: element + settingValue
    std::string element;
    std::string settingValue;

    std::string journalCategory() const;
    std::string journalKey() const;
};

// Data for one run of tunelog-unit: what the phase changes and which part
// of a journal it rolls back.
struct PhaseProfile {
    std::string phase;
    std::string description;
    std::vector<ProfileAction> actions;
    std::vector<RollbackFilter> rollbackFilters;
    bool explicitRollbackFilters = false;

    // Explicit filters when the profile names them, else one exact-key
    // filter per action. Empty means the phase rolls nothing back.
    std::vector<RollbackFilter> effectiveRollbackFilters() const;
};

std::string toActionTypeString(ActionType type);

// Throws std::invalid_argument (or a nlohmann::json exception) on a profile
// that is not well-formed.
PhaseProfile parsePhaseProfile(const nlohmann::json &json);

// Throws std::runtime_error when the file cannot be read or parsed.
PhaseProfile loadPhaseProfile(const QString &path);

} // namespace tunelog
