#include "fakes.hpp"
#include "gatewatch/core/CancelToken.hpp"
#include "gatewatch/watchdog/Scheduler.hpp"
#include "gatewatch/watchdog/WatchdogMachine.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdio>
#include <thread>

using namespace gatewatch;
using namespace gatewatch::test;

namespace {

bool wait_for_ticks(const Scheduler& s, uint64_t n, std::chrono::milliseconds limit) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (s.ticks_completed() >= n) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return s.ticks_completed() >= n;
}

// Probe that hangs like a wedged CLI until the shared token trips.
class BlockingProber : public HealthProber {
public:
    explicit BlockingProber(const CancelToken& token) : token_(token) {}

    ProbeResult probe() override {
        entered = true;
        auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(30);
        while (!token_.cancelled() && std::chrono::steady_clock::now() < give_up) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        throw ProbeError("cancelled");
    }

    std::atomic<bool> entered{false};

private:
    const CancelToken& token_;
};

void test_disabled_arms_nothing() {
    WatchdogConfig cfg;
    cfg.enabled = false;
    ScriptedProber prober;
    RecordingSink sink;
    RecordingRecovery recovery;
    RecordingLogger log;
    WatchdogMachine machine("gateway", cfg, prober, sink, recovery, log);

    auto s = Scheduler::start(cfg, machine, log);
    assert(!s);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(prober.calls == 0);
    assert(log.infos.empty());
}

void test_immediate_tick_then_prompt_stop() {
    WatchdogConfig cfg;
    cfg.interval_sec = 3600;
    cfg.recover.enabled = true;
    ScriptedProber prober;
    prober.push(ProbeStep::UNHEALTHY, "clawdbot");
    RecordingSink sink;
    RecordingRecovery recovery;
    RecordingLogger log;
    WatchdogMachine machine("gateway", cfg, prober, sink, recovery, log);

    auto s = Scheduler::start(cfg, machine, log);
    assert(s);
    assert(log.any_info_contains("watchdog: started (interval=3600s threshold=3 recover=on)"));
    assert(wait_for_ticks(*s, 1, std::chrono::seconds(5)));
    assert(machine.state().consecutive_failures == 1);

    // Next tick is an hour out; stop must cancel the timer, not wait for it.
    auto t0 = std::chrono::steady_clock::now();
    s->stop();
    assert(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(2));
    assert(!s->running());
    s->stop();   // idempotent
    assert(prober.calls == 1);
    assert(sink.sent.size() == 1);
}

void test_destroying_handle_stops() {
    WatchdogConfig cfg;
    cfg.interval_sec = 3600;
    ScriptedProber prober;
    RecordingSink sink;
    RecordingRecovery recovery;
    RecordingLogger log;
    WatchdogMachine machine("gateway", cfg, prober, sink, recovery, log);
    {
        auto s = Scheduler::start(cfg, machine, log);
        assert(wait_for_ticks(*s, 1, std::chrono::seconds(5)));
    }
    assert(log.any_info_contains("watchdog: stopped"));
    assert(machine.state().last_known == HealthState::HEALTHY);
}

// Two independent watchdogs, independent state.
void test_independent_instances() {
    WatchdogConfig cfg;
    cfg.interval_sec = 3600;
    ScriptedProber p1, p2;
    p1.push(ProbeStep::UNHEALTHY);
    RecordingSink s1, s2;
    RecordingRecovery r1, r2;
    RecordingLogger log;
    WatchdogMachine m1("gateway-a", cfg, p1, s1, r1, log);
    WatchdogMachine m2("gateway-b", cfg, p2, s2, r2, log);

    auto h1 = Scheduler::start(cfg, m1, log);
    auto h2 = Scheduler::start(cfg, m2, log);
    assert(wait_for_ticks(*h1, 1, std::chrono::seconds(5)));
    assert(wait_for_ticks(*h2, 1, std::chrono::seconds(5)));
    h1.reset();
    h2.reset();

    assert(m1.state().consecutive_failures == 1);
    assert(m2.state().consecutive_failures == 0);
    assert(s1.sent.size() == 1 && s1.sent[0].find("watchdog: gateway-a DOWN") == 0);
    assert(s2.sent.empty());
}

void test_repeating_timer_fires() {
    WatchdogConfig cfg;
    cfg.interval_sec = 1;
    ScriptedProber prober;
    RecordingSink sink;
    RecordingRecovery recovery;
    RecordingLogger log;
    WatchdogMachine machine("gateway", cfg, prober, sink, recovery, log);

    auto s = Scheduler::start(cfg, machine, log);
    // Immediate tick plus the first timer tick one second later.
    assert(wait_for_ticks(*s, 2, std::chrono::milliseconds(2500)));
    s->stop();

    const uint64_t ticks = s->ticks_completed();
    const int calls = prober.calls;
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
    assert(s->ticks_completed() == ticks);
    assert(prober.calls == calls);
}

void test_restart_starts_from_fresh_state() {
    WatchdogConfig cfg;
    cfg.interval_sec = 3600;
    ScriptedProber prober;
    prober.push(ProbeStep::UNHEALTHY, "first run");
    prober.push(ProbeStep::UNHEALTHY, "second run");
    RecordingSink sink;
    RecordingRecovery recovery;
    RecordingLogger log;
    WatchdogMachine machine("gateway", cfg, prober, sink, recovery, log);

    auto s = Scheduler::start(cfg, machine, log);
    assert(wait_for_ticks(*s, 1, std::chrono::seconds(5)));
    s->stop();
    assert(machine.state().consecutive_failures == 1);

    s = Scheduler::start(cfg, machine, log);
    assert(wait_for_ticks(*s, 1, std::chrono::seconds(5)));
    s->stop();

    // Counts from zero again, so the second run opens with another early warning.
    assert(machine.state().consecutive_failures == 1);
    assert(sink.count_containing("DOWN (failures=1: ") == 2);
}

void test_reset_clears_everything() {
    WatchdogConfig cfg;
    cfg.failure_threshold = 1;
    cfg.recover.enabled = true;
    ScriptedProber prober;
    prober.push(ProbeStep::UNHEALTHY);
    RecordingSink sink;
    RecordingRecovery recovery;
    RecordingLogger log;
    WatchdogMachine machine("gateway", cfg, prober, sink, recovery, log);

    machine.tick();
    assert(machine.state().last_recovery_at);
    machine.reset();

    WatchdogState st = machine.state();
    assert(st.consecutive_failures == 0);
    assert(!st.last_recovery_at);
    assert(st.last_known == HealthState::UNKNOWN);
}

void test_stop_cancels_hung_tick() {
    WatchdogConfig cfg;
    cfg.interval_sec = 3600;
    CancelToken token;
    BlockingProber prober(token);
    RecordingSink sink;
    RecordingRecovery recovery;
    RecordingLogger log;
    WatchdogMachine machine("gateway", cfg, prober, sink, recovery, log);

    auto s = Scheduler::start(cfg, machine, log, &token);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!prober.entered && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    assert(prober.entered);

    auto t0 = std::chrono::steady_clock::now();
    s->stop();
    assert(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(2));
    assert(token.cancelled());
    assert(s->ticks_completed() == 1);

    // A new run clears the token.
    s = Scheduler::start(cfg, machine, log, &token);
    assert(!token.cancelled());
    s->stop();
}

} // namespace

int main() {
    test_disabled_arms_nothing();
    test_immediate_tick_then_prompt_stop();
    test_destroying_handle_stops();
    test_independent_instances();
    test_repeating_timer_fires();
    test_restart_starts_from_fresh_state();
    test_reset_clears_everything();
    test_stop_cancels_hung_tick();

    std::printf("test_scheduler: OK\n");
    return 0;
}
