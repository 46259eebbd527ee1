#include "gatewatch/watchdog/WatchdogMachine.hpp"
#include "gatewatch/alert/AlertSink.hpp"
#include "gatewatch/probe/HealthProber.hpp"
#include "gatewatch/recovery/RecoveryExecutor.hpp"
#include "gatewatch/core/Logger.hpp"
#include <ctime>
#include <cstdio>
#include <utility>

using namespace gatewatch;

const char* gatewatch::health_state_str(HealthState s) {
    switch (s) {
        case HealthState::UNKNOWN:   return "UNKNOWN";
        case HealthState::HEALTHY:   return "HEALTHY";
        case HealthState::UNHEALTHY: return "UNHEALTHY";
        default: return "INVALID";
    }
}

std::string gatewatch::iso8601_utc(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(tp.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    std::tm tm{};
    gmtime_r(&secs, &tm);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms % 1000));
    return buf;
}

std::string gatewatch::format_status(const std::string& target, bool ok, const std::string& meta,
                                     std::chrono::system_clock::time_point at) {
    std::string s = "watchdog: " + target + (ok ? " OK" : " DOWN");
    if (!meta.empty()) s += " (" + meta + ")";
    s += " @ " + iso8601_utc(at);
    return s;
}

WatchdogMachine::WatchdogMachine(std::string target, const WatchdogConfig& cfg,
                                 HealthProber& prober, AlertSink& sink,
                                 RecoveryExecutor& recovery, Logger& log)
    : target_(std::move(target)), cfg_(cfg), prober_(prober), sink_(sink),
      recovery_(recovery), log_(log) {}

TickReport WatchdogMachine::tick() {
    return tick(Clock::now());
}

TickReport WatchdogMachine::tick(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mtx_);
    TickReport rep;

    // --- Probe ---
    bool ok = false;
    std::string meta;
    try {
        ProbeResult r = prober_.probe();
        ok   = r.healthy;
        meta = r.detail;
    } catch (const std::exception& e) {
        ok   = false;
        meta = e.what();
        log_.warn("watchdog: probe failed: " + meta);
    }
    rep.healthy = ok;
    rep.detail  = meta;

    // --- Healthy: reset, confirm recovery once ---
    if (ok) {
        const bool was_down = state_.last_known == HealthState::UNHEALTHY;
        state_.consecutive_failures = 0;
        state_.last_known = HealthState::HEALTHY;
        if (was_down) {
            ++rep.alerts;
            alert(format_status(target_, true, "", std::chrono::system_clock::now()));
        }
        log_.debug("watchdog: " + target_ + " healthy (" + meta + ")");
        return rep;
    }

    // --- Unhealthy ---
    state_.consecutive_failures += 1;
    state_.last_known = HealthState::UNHEALTHY;
    const int failures = state_.consecutive_failures;
    rep.consecutive_failures = failures;

    // First failure = early warning, threshold = escalation. Nothing between.
    if (failures == 1 || failures == cfg_.failure_threshold) {
        std::string status_meta = "failures=" + std::to_string(failures);
        if (!meta.empty()) status_meta += ": " + meta;
        ++rep.alerts;
        alert(format_status(target_, false, status_meta, std::chrono::system_clock::now()));
    } else {
        log_.debug("watchdog: " + target_ + " still down failures=" + std::to_string(failures));
    }

    // --- Recovery ---
    if (!cfg_.recover.enabled || failures < cfg_.failure_threshold) return rep;
    if (!cooldown_elapsed(now)) {
        log_.debug("watchdog: recovery skipped, cooldown active");
        return rep;
    }

    state_.last_recovery_at = now;
    rep.recovery_attempted = true;

    ++rep.alerts;
    alert("watchdog: attempting recovery: " + cfg_.recover.action +
          " (failures=" + std::to_string(failures) + ")");

    try {
        recovery_.execute(cfg_.recover.action);
    } catch (const std::exception& e) {
        rep.recovery_failed = true;
        log_.error(std::string("watchdog: recovery error: ") + e.what());
        ++rep.alerts;
        alert(std::string("watchdog: recovery failed: ") + e.what());
    }
    return rep;
}

void WatchdogMachine::reset() {
    std::lock_guard<std::mutex> lock(mtx_);
    state_ = WatchdogState{};
}

WatchdogState WatchdogMachine::state() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_;
}

bool WatchdogMachine::alert(const std::string& text) {
    try {
        sink_.send(text);
        return true;
    } catch (const std::exception& e) {
        // Delivery is best effort. The polling loop must outlive the chat server.
        log_.error(std::string("watchdog: alert delivery failed: ") + e.what());
        log_.info(text);
        return false;
    }
}

bool WatchdogMachine::cooldown_elapsed(Clock::time_point now) const {
    if (!state_.last_recovery_at) return true;
    const std::chrono::duration<double> since = now - *state_.last_recovery_at;
    return since.count() >= cfg_.cooldown_sec;
}
