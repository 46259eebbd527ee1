#pragma once

#include "gatewatch/config/WatchdogConfig.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace gatewatch {

class AlertSink;
class HealthProber;
class Logger;
class RecoveryExecutor;

enum class HealthState : uint8_t {
    UNKNOWN   = 0,   // no probe yet
    HEALTHY   = 1,
    UNHEALTHY = 2
};

const char* health_state_str(HealthState s);

// Per-target mutable state. Lives as long as the machine that owns it.
struct WatchdogState {
    using Clock = std::chrono::steady_clock;

    int                              consecutive_failures = 0;
    std::optional<Clock::time_point> last_recovery_at;
    HealthState                      last_known = HealthState::UNKNOWN;
};

// What one tick did. Returned for logging and tests; the machine never
// reads it back.
struct TickReport {
    bool        healthy             = false;
    int         consecutive_failures = 0;
    int         alerts              = 0;   // alerts attempted this tick
    bool        recovery_attempted  = false;
    bool        recovery_failed     = false;
    std::string detail;
};

// ---------------------------------------------------------------------------
// WatchdogMachine — failure / alert / recovery policy for one target.
//
// Per tick:
//   healthy   → failures = 0; alert "OK" only if the previous probe was DOWN.
//   unhealthy → failures += 1; alert on failures == 1 and failures == threshold.
//               Recovery when enabled, failures >= threshold and the cooldown
//               since the last attempt has elapsed.
//
// The recovery timestamp is taken BEFORE the executor runs so a slow restart
// can never be followed by a second attempt inside the cooldown.
//
// tick() never throws. Probe errors count as unhealthy, alert and recovery
// errors are logged and swallowed. Ticks are serialized by mtx_.
// ---------------------------------------------------------------------------
class WatchdogMachine {
public:
    using Clock = WatchdogState::Clock;

    WatchdogMachine(std::string target, const WatchdogConfig& cfg,
                    HealthProber& prober, AlertSink& sink,
                    RecoveryExecutor& recovery, Logger& log);

    TickReport tick();
    TickReport tick(Clock::time_point now);

    // Back to a fresh state. Called by the scheduler on every start so
    // nothing carries over from a previous run.
    void reset();

    WatchdogState state() const;
    const std::string& target() const { return target_; }

private:
    // Sends through the sink; returns false (and logs) on failure.
    bool alert(const std::string& text);
    bool cooldown_elapsed(Clock::time_point now) const;

    const std::string    target_;
    const WatchdogConfig cfg_;
    HealthProber&        prober_;
    AlertSink&           sink_;
    RecoveryExecutor&    recovery_;
    Logger&              log_;

    mutable std::mutex mtx_;
    WatchdogState      state_;
};

// "2026-10-17T08:15:02.123Z"
std::string iso8601_utc(std::chrono::system_clock::time_point tp);

// "watchdog: gateway DOWN (failures=1: clawdbot durationMs=12) @ <ts>"
std::string format_status(const std::string& target, bool ok, const std::string& meta,
                          std::chrono::system_clock::time_point at);

} // namespace gatewatch
