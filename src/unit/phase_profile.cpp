#include "unit/phase_profile.hpp"

#include <set>
#include <stdexcept>
#include <utility>

#include <QFile>

#include "common/json_utils.hpp"
#include "platform/registry_store.hpp"

namespace tunelog {

namespace {

ActionType parseActionType(const std::string &value)
{
    if (value == "registry") {
        return ActionType::Registry;
    }
    if (value == "service") {
        return ActionType::Service;
    }
    if (value == "powercfg") {
        return ActionType::PowerCfg;
    }
    if (value == "bcdedit") {
        return ActionType::BcdEdit;
    }
    throw std::invalid_argument("unknown action type: " + value);
}

std::string requireString(const nlohmann::json &json, const char *field, const std::string &what)
{
    if (!json.contains(field) || !json.at(field).is_string() || json.at(field).get<std::string>().empty()) {
        throw std::invalid_argument(what + " action needs \"" + field + "\"");
    }
    return json.at(field).get<std::string>();
}

ProfileAction parseAction(const nlohmann::json &json)
{
    if (!json.is_object()) {
        throw std::invalid_argument("action must be an object");
    }
    ProfileAction action;
    const std::string type = json.value("type", "");
    action.type = parseActionType(type);
    action.note = json.value("note", "");
    action.optIn = json.value("optIn", "");
    const std::string onError = json.value("onError", "abort");
    if (onError != "abort" && onError != "continue") {
        throw std::invalid_argument("onError must be abort or continue, got " + onError);
    }
    action.continueOnError = onError == "continue";

    switch (action.type) {
    case ActionType::Registry: {
        action.path = requireString(json, "path", type);
        action.name = requireString(json, "name", type);
        if (action.name.find('\\') != std::string::npos) {
            throw std::invalid_argument("registry value name contains a backslash: " + action.name);
        }
        const auto kind = parseRegistryKindString(json.value("kind", "dword"));
        if (!kind.has_value()) {
            throw std::invalid_argument("unknown registry kind for " + action.name);
        }
        action.kind = *kind;
        if (!json.contains("value")) {
            throw std::invalid_argument("registry action needs \"value\"");
        }
        action.value = json.at("value").get<SnapshotValue>();
        if (action.value.isAbsent() || action.value.isService()) {
            throw std::invalid_argument("registry value must be a number or string");
        }
        if ((action.kind == RegistryValueKind::DWord || action.kind == RegistryValueKind::QWord)
            && !action.value.isInt()) {
            throw std::invalid_argument("integer registry kind needs a number for " + action.name);
        }
        break;
    }
    case ActionType::Service: {
        action.name = requireString(json, "name", type);
        if (json.contains("startupType")) {
            action.startupType = parseStartupTypeString(json.at("startupType").get<std::string>());
            if (!action.startupType.has_value()) {
                throw std::invalid_argument("unknown startup type for " + action.name);
            }
        }
        if (json.contains("runState")) {
            const ServiceStatus state =
                parseServiceStatusString(json.at("runState").get<std::string>());
            if (state != ServiceStatus::Running && state != ServiceStatus::Stopped) {
                throw std::invalid_argument("runState must be Running or Stopped for "
                                            + action.name);
            }
            action.runState = state;
        }
        if (!action.startupType.has_value() && !action.runState.has_value()) {
            throw std::invalid_argument("service action changes nothing: " + action.name);
        }
        break;
    }
    case ActionType::PowerCfg:
        action.settingValue = requireString(json, "scheme", type);
        break;
    case ActionType::BcdEdit:
        action.element = requireString(json, "element", type);
        action.settingValue = requireString(json, "value", type);
        break;
    }
    return action;
}

} // namespace

std::string toActionTypeString(ActionType type)
{
    switch (type) {
    case ActionType::Registry:
        return category::Registry;
    case ActionType::Service:
        return category::Service;
    case ActionType::PowerCfg:
        return category::PowerCfg;
    case ActionType::BcdEdit:
        return category::BcdEdit;
    }
    return category::Registry;
}

std::string ProfileAction::journalCategory() const
{
    return toActionTypeString(type);
}

std::string ProfileAction::journalKey() const
{
    switch (type) {
    case ActionType::Registry:
        return registryJournalKey(path, name);
    case ActionType::Service:
        return name;
    case ActionType::PowerCfg:
        return kActiveSchemeKey;
    case ActionType::BcdEdit:
        return element;
    }
    return name;
}

std::vector<RollbackFilter> PhaseProfile::effectiveRollbackFilters() const
{
    if (explicitRollbackFilters) {
        return rollbackFilters;
    }
    std::vector<RollbackFilter> filters;
    std::set<std::pair<std::string, std::string>> seen;
    for (const ProfileAction &action : actions) {
        RollbackFilter filter{action.journalCategory(), action.journalKey()};
        if (seen.insert({filter.category, filter.keyPrefix}).second) {
            filters.push_back(std::move(filter));
        }
    }
    return filters;
}

PhaseProfile parsePhaseProfile(const nlohmann::json &json)
{
    if (!json.is_object()) {
        throw std::invalid_argument("profile must be a JSON object");
    }
    PhaseProfile profile;
    profile.phase = json.value("phase", "");
    if (profile.phase.empty()) {
        throw std::invalid_argument("profile needs a \"phase\" name");
    }
    profile.description = json.value("description", "");

    if (json.contains("actions")) {
        if (!json.at("actions").is_array()) {
            throw std::invalid_argument("\"actions\" must be an array");
        }
        for (const auto &item : json.at("actions")) {
            profile.actions.push_back(parseAction(item));
        }
    }

    if (json.contains("rollback") && json.at("rollback").contains("filters")) {
        profile.rollbackFilters =
            json.at("rollback").at("filters").get<std::vector<RollbackFilter>>();
        profile.explicitRollbackFilters = true;
    }
    return profile;
}

PhaseProfile loadPhaseProfile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw std::runtime_error("cannot open profile " + path.toStdString() + ": "
                                 + file.errorString().toStdString());
    }
    try {
        return parsePhaseProfile(nlohmann::json::parse(file.readAll().toStdString()));
    } catch (const std::exception &ex) {
        throw std::runtime_error("invalid profile " + path.toStdString() + ": " + ex.what());
    }
}

} // namespace tunelog
