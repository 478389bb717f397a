#include "platform/backend_factory.hpp"

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "platform/platform_error.hpp"
#include "platform/simulated_backends.hpp"

#ifdef Q_OS_WIN
#include "platform/win32_registry_store.hpp"
#endif

namespace tunelog {

namespace {

[[noreturn]] void unsupported(const char *concern, const std::string &name)
{
    throw PlatformError(PlatformErrorKind::Unsupported,
                        std::string("unknown ") + concern + " backend: " + name);
}

} // namespace

Backends makeBackends(const AppConfig &config, logging::Logger &logger)
{
    const QString statePath = config.resolvedStatePath();
    Backends backends;

    if (config.backends.registry == "ini") {
        backends.registry = std::make_unique<IniRegistryStore>(statePath);
#ifdef Q_OS_WIN
    } else if (config.backends.registry == "win32") {
        backends.registry = std::make_unique<Win32RegistryStore>();
#endif
    } else {
        unsupported("registry", config.backends.registry);
    }

    if (config.backends.services == "ini") {
        backends.services = std::make_unique<IniServiceManager>(statePath);
    } else if (config.backends.services == "sc") {
        backends.services = std::make_unique<ScServiceManager>(logger);
    } else if (config.backends.services == "systemd") {
        backends.services = std::make_unique<SystemdServiceManager>(logger);
    } else {
        unsupported("services", config.backends.services);
    }

    if (config.backends.powercfg == "ini") {
        backends.powercfg = std::make_unique<IniSettingStore>(statePath, category::PowerCfg);
    } else if (config.backends.powercfg == "powercfg") {
        backends.powercfg = std::make_unique<PowerCfgStore>(logger);
    } else {
        unsupported("powercfg", config.backends.powercfg);
    }

    if (config.backends.bcdedit == "ini") {
        backends.bcdedit = std::make_unique<IniSettingStore>(statePath, category::BcdEdit);
    } else if (config.backends.bcdedit == "bcdedit") {
        backends.bcdedit = std::make_unique<BcdEditStore>(logger);
    } else {
        unsupported("bcdedit", config.backends.bcdedit);
    }

    TLOG_DEBUG(logger,
               QStringLiteral("BackendFactory"),
               QStringLiteral("makeBackends"),
               QStringLiteral("backends_ready"),
               QStringLiteral("unit_start"),
               QStringLiteral("config_selection"),
               (nlohmann::json{{"registry", config.backends.registry},
                               {"services", config.backends.services},
                               {"powercfg", config.backends.powercfg},
                               {"bcdedit", config.backends.bcdedit},
                               {"statePath", statePath.toStdString()}}));
    return backends;
}

} // namespace tunelog
