#include "gatewatch/probe/HealthProber.hpp"
#include "gatewatch/probe/JsonExtract.hpp"
#include "gatewatch/process/ProcessRunner.hpp"
#include "gatewatch/core/Errors.hpp"
#include "gatewatch/core/Logger.hpp"
#include <cmath>
#include <sstream>
#include <vector>

using namespace gatewatch;
using json = nlohmann::json;

const char* gatewatch::backend_binary(ProbeBackend b) {
    switch (b) {
        case ProbeBackend::CLAWDBOT: return "clawdbot";
        case ProbeBackend::OPENCLAW: return "openclaw";
        default: return "unknown";
    }
}

CliHealthProber::CliHealthProber(ProcessRunner& runner, Logger& log,
                                 std::chrono::milliseconds timeout)
    : runner_(runner), log_(log), timeout_(timeout) {}

ProbeResult CliHealthProber::probe() {
    std::string last_error = "health failed";

    for (ProbeBackend b : PROBE_BACKEND_ORDER) {
        try {
            return probe_backend(b);
        } catch (const std::exception& e) {
            last_error = e.what();
            log_.debug(std::string("watchdog: probe via ") + backend_binary(b) +
                       " failed: " + last_error);
        }
    }

    throw ProbeError(last_error);
}

ProbeResult CliHealthProber::probe_backend(ProbeBackend b) {
    const std::string bin = backend_binary(b);
    const std::vector<std::string> argv = {bin, "gateway", "health", "--json"};

    ProcessResult r = runner_.run(argv, timeout_);
    if (!r.ok()) {
        throw ProbeError(describe_command(argv) + " " + describe_failure(r, timeout_));
    }

    json health = extract_last_json_object(r.combined());

    // Truthiness of `ok`, not strict bool — older CLIs print 1/0.
    bool ok = false;
    if (health.is_object()) {
        auto it = health.find("ok");
        if (it != health.end()) {
            if (it->is_boolean())      ok = it->get<bool>();
            else if (it->is_number())  ok = it->get<double>() != 0.0;
            else if (it->is_string())  ok = !it->get<std::string>().empty();
            else if (it->is_object() || it->is_array()) ok = true;
        }
    }

    std::ostringstream detail;
    detail << bin;
    if (health.is_object()) {
        auto it = health.find("durationMs");
        if (it != health.end() && it->is_number()) {
            double ms = it->get<double>();
            if (std::floor(ms) == ms) detail << " durationMs=" << static_cast<long long>(ms);
            else                      detail << " durationMs=" << ms;
        }
    }

    return ProbeResult{ok, detail.str()};
}
