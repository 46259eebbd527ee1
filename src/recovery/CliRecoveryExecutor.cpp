#include "gatewatch/recovery/RecoveryExecutor.hpp"
#include "gatewatch/process/ProcessRunner.hpp"
#include "gatewatch/core/Errors.hpp"
#include "gatewatch/core/Logger.hpp"
#include <vector>

using namespace gatewatch;

CliRecoveryExecutor::CliRecoveryExecutor(ProcessRunner& runner, Logger& log,
                                         std::chrono::milliseconds timeout)
    : runner_(runner), log_(log), timeout_(timeout) {}

void CliRecoveryExecutor::execute(const std::string& action) {
    if (action != GATEWAY_RESTART) {
        throw RecoveryError("unknown recover action: " + action);
    }

    const std::vector<std::string> argv = {"clawdbot", "gateway", "restart"};
    log_.info("watchdog: running " + describe_command(argv));

    ProcessResult r;
    try {
        r = runner_.run(argv, timeout_);
    } catch (const std::exception& e) {
        throw RecoveryError(describe_command(argv) + ": " + e.what());
    }

    if (!r.ok()) {
        throw RecoveryError(describe_command(argv) + " " + describe_failure(r, timeout_));
    }
    log_.info("watchdog: " + describe_command(argv) + " completed");
}
