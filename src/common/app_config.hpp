#pragma once

#include <optional>
#include <string>
#include <vector>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace tunelog {

struct BackendSelection {
    // registry: "win32" | "ini"; services: "sc" | "systemd" | "ini";
    // powercfg: "powercfg" | "ini"; bcdedit: "bcdedit" | "ini".
    std::string registry;
    std::string services;
    std::string powercfg;
    std::string bcdedit;
};

struct AppConfig {
    QString workspaceRoot;
    bool requireElevation = true;
    bool trace = false;
    int defaultTimeoutMs = 600000;
    int readerGraceMs = 5000;
    QString powershellPath;
    BackendSelection backends;
    // Relative paths resolve against the workspace.
    QString simulatedStatePath;
    std::vector<PhaseSpec> applyPipeline;
    std::vector<PhaseSpec> rollbackPipeline;

    QString configFile() const;
    QString resolvedStatePath() const;
    int timeoutFor(const PhaseSpec &phase) const;
};

// Built-in values for the current platform, rooted at workspaceRoot.
AppConfig defaultAppConfig(const QString &workspaceRoot);
std::vector<PhaseSpec> defaultApplyPipeline();
std::vector<PhaseSpec> defaultRollbackPipeline();

// Overlays the keys present in json onto config. Throws on a non-object
// root or wrongly typed values.
void applyConfigJson(AppConfig &config, const nlohmann::json &json);

// Resolution order: defaults, <workspace>/tunelog.json, environment.
// workspaceOverride wins over TUNELOG_WORKSPACE when not empty.
// errorMessage is filled when the file exists but cannot be used; the
// defaults are kept in that case.
AppConfig loadAppConfig(const QString &workspaceOverride = QString(),
                        std::string *errorMessage = nullptr);

nlohmann::json appConfigToJson(const AppConfig &config);

} // namespace tunelog
