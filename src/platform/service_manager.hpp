#pragma once

#include <string>

#include "common/enums.hpp"
#include "common/models.hpp"

namespace tunelog::logging {
class Logger;
}

namespace tunelog {

// Service configuration and run state. Implementations throw PlatformError.
class ServiceManager {
public:
    virtual ~ServiceManager() = default;

    // Textual status and startup type as understood by json_utils.
    virtual ServiceStateSnapshot query(const std::string &name) = 0;
    virtual void setStartupType(const std::string &name, StartupType type) = 0;
    // Starting a running service or stopping a stopped one is not an error.
    virtual void start(const std::string &name) = 0;
    virtual void stop(const std::string &name) = 0;
};

// Windows service control through sc.exe.
class ScServiceManager : public ServiceManager {
public:
    explicit ScServiceManager(logging::Logger &logger);

    ServiceStateSnapshot query(const std::string &name) override;
    void setStartupType(const std::string &name, StartupType type) override;
    void start(const std::string &name) override;
    void stop(const std::string &name) override;

private:
    void waitWhilePending(const std::string &name);

    logging::Logger &m_logger;
};

// systemd units. Automatic maps to enabled, Manual to disabled and
// Disabled to masked.
class SystemdServiceManager : public ServiceManager {
public:
    explicit SystemdServiceManager(logging::Logger &logger);

    ServiceStateSnapshot query(const std::string &name) override;
    void setStartupType(const std::string &name, StartupType type) override;
    void start(const std::string &name) override;
    void stop(const std::string &name) override;

private:
    logging::Logger &m_logger;
};

} // namespace tunelog
