#pragma once

#include "gatewatch/config/WatchdogConfig.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

namespace gatewatch {

class CancelToken;
class Logger;
class WatchdogMachine;

// ---------------------------------------------------------------------------
// Scheduler — drives one WatchdogMachine on a fixed interval.
//
// start() returns the owning handle; destroying it (or stop()) cancels the
// timer. A disabled config yields no handle and arms nothing.
//
// THREADING: one worker thread runs an io_context. The immediate tick and
//   every timer tick execute on that thread, so ticks for a target never
//   overlap. Periods missed while a tick overran are skipped, not queued.
//
// start() clears the machine's state and the optional cancel token.
// stop() trips the token, so external calls made by a tick in flight fail
// fast, then waits for that tick to return. Safe to call repeatedly.
// ---------------------------------------------------------------------------
class Scheduler {
public:
    using Clock = std::chrono::steady_clock;

    static std::unique_ptr<Scheduler> start(const WatchdogConfig& cfg,
                                            WatchdogMachine& machine, Logger& log,
                                            CancelToken* cancel = nullptr);

    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void stop();

    bool     running() const { return !stopping_.load(); }
    uint64_t ticks_completed() const { return ticks_.load(); }

private:
    Scheduler(Clock::duration interval, WatchdogMachine& machine, Logger& log,
              CancelToken* cancel);

    void launch();
    void run_tick();
    void arm();
    void on_timer(const boost::system::error_code& ec);

    Clock::duration           interval_;
    WatchdogMachine&          machine_;
    Logger&                   log_;
    CancelToken*              cancel_;

    boost::asio::io_context   io_;
    boost::asio::steady_timer timer_;
    Clock::time_point         next_due_;
    std::thread               worker_;

    std::atomic<bool>         stopping_{false};
    std::atomic<uint64_t>     ticks_{0};
};

} // namespace gatewatch
