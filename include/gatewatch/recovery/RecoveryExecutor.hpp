#pragma once

#include <chrono>
#include <string>

namespace gatewatch {

class Logger;
class ProcessRunner;

// Runs a named recovery action. Throws RecoveryError on any failure,
// including an action it does not know.
class RecoveryExecutor {
public:
    virtual ~RecoveryExecutor() = default;
    virtual void execute(const std::string& action) = 0;
};

// Restarts through the gateway's own CLI so launchd and systemd installs
// behave the same.
class CliRecoveryExecutor : public RecoveryExecutor {
public:
    static constexpr const char* GATEWAY_RESTART = "gateway-restart";
    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{60000};

    CliRecoveryExecutor(ProcessRunner& runner, Logger& log,
                        std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);

    void execute(const std::string& action) override;

private:
    ProcessRunner&            runner_;
    Logger&                   log_;
    std::chrono::milliseconds timeout_;
};

} // namespace gatewatch
