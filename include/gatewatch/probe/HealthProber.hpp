#pragma once

#include <array>
#include <cstdint>
#include <chrono>
#include <string>

namespace gatewatch {

class Logger;
class ProcessRunner;

struct ProbeResult {
    bool        healthy = false;
    std::string detail;          // "clawdbot durationMs=42"
};

// One health check against the monitored target. Throws ProbeError when no
// usable result could be obtained at all.
class HealthProber {
public:
    virtual ~HealthProber() = default;
    virtual ProbeResult probe() = 0;
};

// ---------------------------------------------------------------------------
// Probe backends, in priority order. Both CLIs expose the same
// `gateway health --json` command; the first that answers wins.
// ---------------------------------------------------------------------------
enum class ProbeBackend : uint8_t {
    CLAWDBOT = 0,
    OPENCLAW = 1
};

constexpr std::array<ProbeBackend, 2> PROBE_BACKEND_ORDER = {
    ProbeBackend::CLAWDBOT,
    ProbeBackend::OPENCLAW
};

const char* backend_binary(ProbeBackend b);

class CliHealthProber : public HealthProber {
public:
    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{10000};

    CliHealthProber(ProcessRunner& runner, Logger& log,
                    std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);

    ProbeResult probe() override;

private:
    // Throws on timeout, non-zero exit, or unparseable output.
    ProbeResult probe_backend(ProbeBackend b);

    ProcessRunner&            runner_;
    Logger&                   log_;
    std::chrono::milliseconds timeout_;
};

} // namespace gatewatch
