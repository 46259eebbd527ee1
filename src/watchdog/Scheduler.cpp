#include "gatewatch/watchdog/Scheduler.hpp"
#include "gatewatch/watchdog/WatchdogMachine.hpp"
#include "gatewatch/core/CancelToken.hpp"
#include "gatewatch/core/Logger.hpp"
#include <boost/asio/post.hpp>
#include <cmath>
#include <sstream>

using namespace gatewatch;
namespace asio = boost::asio;

namespace {

std::string format_seconds(double s) {
    std::ostringstream ss;
    if (std::floor(s) == s) ss << static_cast<long long>(s);
    else                    ss << s;
    return ss.str();
}

} // namespace

std::unique_ptr<Scheduler> Scheduler::start(const WatchdogConfig& cfg,
                                            WatchdogMachine& machine, Logger& log,
                                            CancelToken* cancel) {
    if (!cfg.enabled) return nullptr;

    auto interval = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(cfg.interval_sec));
    if (interval < std::chrono::seconds(1)) interval = std::chrono::seconds(1);

    log.info("watchdog: started (interval=" + format_seconds(cfg.interval_sec) +
             "s threshold=" + std::to_string(cfg.failure_threshold) +
             " recover=" + (cfg.recover.enabled ? "on" : "off") + ")");

    machine.reset();
    if (cancel) cancel->reset();

    std::unique_ptr<Scheduler> s(new Scheduler(interval, machine, log, cancel));
    s->launch();
    return s;
}

Scheduler::Scheduler(Clock::duration interval, WatchdogMachine& machine, Logger& log,
                     CancelToken* cancel)
    : interval_(interval), machine_(machine), log_(log), cancel_(cancel), timer_(io_) {}

Scheduler::~Scheduler() {
    stop();
}

void Scheduler::launch() {
    next_due_ = Clock::now() + interval_;

    // Kick immediately, then fall into the fixed-rate timer.
    asio::post(io_, [this]() {
        if (stopping_.load()) return;
        run_tick();
        if (stopping_.load()) return;
        arm();
    });

    worker_ = std::thread([this]() {
        try {
            io_.run();
        } catch (const std::exception& e) {
            log_.error(std::string("watchdog: scheduler loop failed: ") + e.what());
        }
    });
}

void Scheduler::stop() {
    if (!stopping_.exchange(true)) {
        if (cancel_) cancel_->cancel();
        asio::post(io_, [this]() { timer_.cancel(); });
    }

    // Called from inside a tick: the worker unwinds on its own, join later.
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
        log_.info("watchdog: stopped");
    }
}

void Scheduler::run_tick() {
    try {
        TickReport rep = machine_.tick();
        log_.debug("watchdog: tick " + machine_.target() +
                   " healthy=" + (rep.healthy ? "1" : "0") +
                   " failures=" + std::to_string(rep.consecutive_failures) +
                   " alerts=" + std::to_string(rep.alerts) +
                   (rep.recovery_attempted ? " recovery=attempted" : ""));
    } catch (const std::exception& e) {
        // tick() does not throw; anything here is a bug, never a reason to stop polling.
        log_.error(std::string("watchdog: tick failed: ") + e.what());
    }
    ticks_.fetch_add(1);
}

void Scheduler::arm() {
    const auto now = Clock::now();
    while (next_due_ <= now) next_due_ += interval_;

    timer_.expires_at(next_due_);
    timer_.async_wait([this](const boost::system::error_code& ec) { on_timer(ec); });
}

void Scheduler::on_timer(const boost::system::error_code& ec) {
    if (ec == asio::error::operation_aborted || stopping_.load()) return;
    if (ec) {
        log_.error("watchdog: timer error: " + ec.message());
        arm();
        return;
    }
    run_tick();
    if (stopping_.load()) return;
    arm();
}
