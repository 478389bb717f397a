#include "common/app_config.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include "common/json_utils.hpp"

namespace tunelog {

namespace {

const char *kUnitProgram = "tunelog-unit";

PhaseSpec unitPhase(const std::string &name, const std::string &title, bool advisory)
{
    PhaseSpec phase;
    phase.name = name;
    phase.title = title;
    phase.runner = RunnerKind::Native;
    phase.program = kUnitProgram;
    phase.profile = "Profiles/" + name + ".json";
    phase.advisory = advisory;
    return phase;
}

QString defaultWorkspaceRoot()
{
    if (QCoreApplication::instance()) {
        return QCoreApplication::applicationDirPath();
    }
    return QDir::currentPath();
}

BackendSelection defaultBackends()
{
    BackendSelection backends;
#ifdef Q_OS_WIN
    backends.registry = "win32";
    backends.services = "sc";
    backends.powercfg = "powercfg";
    backends.bcdedit = "bcdedit";
#else
    backends.registry = "ini";
    backends.services = "systemd";
    backends.powercfg = "ini";
    backends.bcdedit = "ini";
#endif
    return backends;
}

std::vector<PhaseSpec> parsePipeline(const nlohmann::json &json)
{
    std::vector<PhaseSpec> phases;
    for (const auto &item : json) {
        PhaseSpec phase = item.get<PhaseSpec>();
        if (!phase.name.empty()) {
            phases.push_back(std::move(phase));
        }
    }
    return phases;
}

} // namespace

QString AppConfig::configFile() const
{
    return QDir(workspaceRoot).filePath(QStringLiteral("tunelog.json"));
}

QString AppConfig::resolvedStatePath() const
{
    const QString path = simulatedStatePath.isEmpty()
        ? QStringLiteral("Backup/simulated-state.ini")
        : simulatedStatePath;
    if (QFileInfo(path).isAbsolute()) {
        return path;
    }
    return QDir(workspaceRoot).filePath(path);
}

int AppConfig::timeoutFor(const PhaseSpec &phase) const
{
    return phase.timeoutMs > 0 ? phase.timeoutMs : defaultTimeoutMs;
}

std::vector<PhaseSpec> defaultApplyPipeline()
{
    std::vector<PhaseSpec> phases;
    phases.push_back(unitPhase("diagnosis", "Diagnosis (no changes)", true));

    PhaseSpec backup = unitPhase("backup", "Backup and safety", false);
    backup.confirm = "Create a restore point and continue with the changes?";
    phases.push_back(backup);

    phases.push_back(unitPhase("system-power", "System and power", false));

    PhaseSpec timers = unitPhase("timers-latency", "Timers and latency", false);
    timers.optIns.push_back({"EnableBcdTweaks",
                             "Enable boot configuration tweaks (bcdedit)?"});
    phases.push_back(timers);

    phases.push_back(unitPhase("cpu-scheduler", "CPU and scheduler", false));
    phases.push_back(unitPhase("gpu-drivers", "GPU and drivers (guidance)", true));
    phases.push_back(unitPhase("input-usb", "Input (USB/HID power saving)", false));
    phases.push_back(unitPhase("network", "Network", false));
    phases.push_back(unitPhase("registry-tweaks", "Registry advanced (reversible)", false));
    phases.push_back(unitPhase("validation", "Validation and summary", true));
    return phases;
}

std::vector<PhaseSpec> defaultRollbackPipeline()
{
    std::vector<PhaseSpec> phases;
    phases.push_back(unitPhase("backup", "Backup and safety", false));
    phases.push_back(unitPhase("system-power", "System and power", false));
    phases.push_back(unitPhase("timers-latency", "Timers and latency", false));
    phases.push_back(unitPhase("cpu-scheduler", "CPU and scheduler", false));
    phases.push_back(unitPhase("input-usb", "Input (USB/HID power saving)", false));
    phases.push_back(unitPhase("network", "Network", false));
    phases.push_back(unitPhase("registry-tweaks", "Registry advanced (reversible)", false));
    phases.push_back(unitPhase("validation", "Validation and summary", true));
    return phases;
}

AppConfig defaultAppConfig(const QString &workspaceRoot)
{
    AppConfig config;
    config.workspaceRoot = workspaceRoot;
    config.backends = defaultBackends();
    config.applyPipeline = defaultApplyPipeline();
    config.rollbackPipeline = defaultRollbackPipeline();
    return config;
}

void applyConfigJson(AppConfig &config, const nlohmann::json &json)
{
    if (!json.is_object()) {
        throw std::invalid_argument("config root must be an object");
    }
    config.requireElevation = json.value("requireElevation", config.requireElevation);
    config.trace = json.value("trace", config.trace);
    config.defaultTimeoutMs = json.value("defaultTimeoutMs", config.defaultTimeoutMs);
    config.readerGraceMs = json.value("readerGraceMs", config.readerGraceMs);
    if (json.contains("powershellPath")) {
        config.powershellPath = QString::fromStdString(json.at("powershellPath").get<std::string>());
    }
    if (json.contains("simulatedStatePath")) {
        config.simulatedStatePath =
            QString::fromStdString(json.at("simulatedStatePath").get<std::string>());
    }
    if (json.contains("backends")) {
        const auto &backends = json.at("backends");
        config.backends.registry = backends.value("registry", config.backends.registry);
        config.backends.services = backends.value("services", config.backends.services);
        config.backends.powercfg = backends.value("powercfg", config.backends.powercfg);
        config.backends.bcdedit = backends.value("bcdedit", config.backends.bcdedit);
    }
    if (json.contains("pipeline")) {
        const auto &pipeline = json.at("pipeline");
        if (pipeline.contains("apply")) {
            config.applyPipeline = parsePipeline(pipeline.at("apply"));
        }
        if (pipeline.contains("rollback")) {
            config.rollbackPipeline = parsePipeline(pipeline.at("rollback"));
        }
    }
}

AppConfig loadAppConfig(const QString &workspaceOverride, std::string *errorMessage)
{
    QString workspace = workspaceOverride;
    if (workspace.isEmpty()) {
        workspace = qEnvironmentVariable("TUNELOG_WORKSPACE");
    }
    if (workspace.isEmpty()) {
        workspace = defaultWorkspaceRoot();
    }

    AppConfig config = defaultAppConfig(QDir(workspace).absolutePath());

    QFile file(config.configFile());
    if (file.exists()) {
        if (!file.open(QIODevice::ReadOnly)) {
            if (errorMessage) {
                *errorMessage = "cannot open " + config.configFile().toStdString();
            }
        } else {
            try {
                const auto json = nlohmann::json::parse(file.readAll().toStdString());
                AppConfig candidate = config;
                applyConfigJson(candidate, json);
                config = candidate;
            } catch (const std::exception &ex) {
                if (errorMessage) {
                    *errorMessage = config.configFile().toStdString() + ": " + ex.what();
                }
            }
        }
    }

    if (qEnvironmentVariableIntValue("TUNELOG_TRACE") == 1) {
        config.trace = true;
    }
    bool ok = false;
    const int timeout = qEnvironmentVariableIntValue("TUNELOG_PHASE_TIMEOUT_MS", &ok);
    if (ok && timeout > 0) {
        config.defaultTimeoutMs = timeout;
    }
    if (qEnvironmentVariableIntValue("TUNELOG_SKIP_ELEVATION_CHECK") == 1) {
        config.requireElevation = false;
    }
    return config;
}

nlohmann::json appConfigToJson(const AppConfig &config)
{
    return nlohmann::json{
        {"workspaceRoot", config.workspaceRoot.toStdString()},
        {"requireElevation", config.requireElevation},
        {"trace", config.trace},
        {"defaultTimeoutMs", config.defaultTimeoutMs},
        {"readerGraceMs", config.readerGraceMs},
        {"powershellPath", config.powershellPath.toStdString()},
        {"simulatedStatePath", config.resolvedStatePath().toStdString()},
        {"backends", {{"registry", config.backends.registry},
                      {"services", config.backends.services},
                      {"powercfg", config.backends.powercfg},
                      {"bcdedit", config.backends.bcdedit}}},
        {"pipeline", {{"apply", config.applyPipeline},
                      {"rollback", config.rollbackPipeline}}}
    };
}

} // namespace tunelog
