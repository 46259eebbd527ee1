// ---------------------------------------------------------------------------
// gatewatch — gateway health watchdog.
//
// Probes the gateway through its CLI every interval, alerts Rocket.Chat on
// the first failure and at the failure threshold, and optionally restarts the
// gateway (cooldown gated).
//
// Usage:
//   ./gatewatch [--config <path>] [--verbose]
//
// Defaults:
//   config = gatewatch.json
// ---------------------------------------------------------------------------
#include "gatewatch/alert/AlertSink.hpp"
#include "gatewatch/alert/ChatTransport.hpp"
#include "gatewatch/config/ConfigLoader.hpp"
#include "gatewatch/core/CancelToken.hpp"
#include "gatewatch/core/Errors.hpp"
#include "gatewatch/core/Logger.hpp"
#include "gatewatch/probe/HealthProber.hpp"
#include "gatewatch/process/ProcessRunner.hpp"
#include "gatewatch/recovery/RecoveryExecutor.hpp"
#include "gatewatch/watchdog/Scheduler.hpp"
#include "gatewatch/watchdog/WatchdogMachine.hpp"

#include <curl/curl.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

using namespace gatewatch;

static std::atomic<bool> g_running{true};

static void signal_handler(int) {
    g_running = false;
}

static void usage(const char* argv0) {
    std::fprintf(stderr, "Usage: %s [--config <path>] [--verbose]\n", argv0);
}

int main(int argc, char** argv) {
    std::string config_path = "gatewatch.json";
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    ConsoleLogger log("WATCHDOG", verbose);

    HostConfig host;
    try {
        host = load_host_config(config_path);
    } catch (const ConfigError& e) {
        std::cerr << "[WATCHDOG] " << e.what() << "\n";
        return 1;
    }

    if (!host.watchdog.enabled) {
        log.info("watchdog: disabled in config, nothing to do");
        return 0;
    }

    std::signal(SIGINT,  signal_handler);
    std::signal(SIGTERM, signal_handler);

    curl_global_init(CURL_GLOBAL_ALL);

    int rc = 0;
    try {
        // Tripped by the scheduler on stop so a hung CLI or chat server
        // cannot hold up shutdown.
        CancelToken         cancel;
        PosixProcessRunner  runner(&cancel);
        CurlChatTransport   transport(std::chrono::seconds(10), std::chrono::seconds(5), &cancel);
        CliHealthProber     prober(runner, log);
        RocketChatAlertSink sink(host.watchdog.alert, host.rocketchat, transport, log);
        CliRecoveryExecutor recovery(runner, log);
        WatchdogMachine     machine("gateway", host.watchdog, prober, sink, recovery, log);

        auto scheduler = Scheduler::start(host.watchdog, machine, log, &cancel);

        while (g_running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        log.info("watchdog: shutdown requested");
        scheduler.reset();
    } catch (const std::exception& e) {
        log.error(std::string("watchdog: fatal: ") + e.what());
        rc = 1;
    }

    curl_global_cleanup();
    return rc;
}
