#pragma once

#include <memory>

#include "common/app_config.hpp"
#include "platform/registry_store.hpp"
#include "platform/service_manager.hpp"
#include "platform/setting_store.hpp"

namespace tunelog::logging {
class Logger;
}

namespace tunelog {

// The stores a mutator unit talks to, one per journal category.
struct Backends {
    std::unique_ptr<RegistryStore> registry;
    std::unique_ptr<ServiceManager> services;
    std::unique_ptr<SettingStore> powercfg;
    std::unique_ptr<SettingStore> bcdedit;
};

// Builds the backends named in config.backends. Throws PlatformError
// (Unsupported) for a name that is unknown or unavailable on this platform.
// The logger must outlive the returned backends.
Backends makeBackends(const AppConfig &config, logging::Logger &logger);

} // namespace tunelog
