#pragma once

#include <stdexcept>
#include <string>

namespace gatewatch {

// Base for every failure a watchdog component reports. Tick code catches
// std::exception, so anything thrown below ends up logged, never fatal.
class WatchdogError : public std::runtime_error {
public:
    explicit WatchdogError(const std::string& msg) : std::runtime_error(msg) {}
};

// No probe backend produced a usable result. Counted as an unhealthy outcome.
class ProbeError : public WatchdogError {
public:
    explicit ProbeError(const std::string& msg) : WatchdogError(msg) {}
};

// Notification delivery failed.
class AlertError : public WatchdogError {
public:
    explicit AlertError(const std::string& msg) : WatchdogError(msg) {}
};

// Recovery action failed or is not recognized.
class RecoveryError : public WatchdogError {
public:
    explicit RecoveryError(const std::string& msg) : WatchdogError(msg) {}
};

// Child process could not be spawned (pipe/fork failure).
class ProcessError : public WatchdogError {
public:
    explicit ProcessError(const std::string& msg) : WatchdogError(msg) {}
};

class ConfigError : public WatchdogError {
public:
    explicit ConfigError(const std::string& msg) : WatchdogError(msg) {}
};

} // namespace gatewatch
