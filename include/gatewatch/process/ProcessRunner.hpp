#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace gatewatch {

class CancelToken;

struct ProcessResult {
    int         exit_code = -1;     // -1 when killed by a signal, on timeout or on cancel
    bool        timed_out = false;
    std::string out;                // captured stdout
    std::string err;                // captured stderr
    bool        cancelled = false;  // killed, or never spawned, because of shutdown
    bool        output_overflow = false;   // a stream passed MAX_OUTPUT_BYTES; child killed

    bool ok() const { return !timed_out && !cancelled && !output_overflow && exit_code == 0; }

    // stdout + "\n" + stderr — what the probe parser sees.
    std::string combined() const { return out + "\n" + err; }
};

// ---------------------------------------------------------------------------
// Runs one external command to completion or timeout.
//
// run() never blocks past `timeout` (plus reap time): a child that overruns
// is SIGKILLed. Spawn failures throw ProcessError; everything after spawn is
// reported through ProcessResult.
// ---------------------------------------------------------------------------
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual ProcessResult run(const std::vector<std::string>& argv,
                              std::chrono::milliseconds timeout) = 0;
};

// A child is also SIGKILLed when it writes more than MAX_OUTPUT_BYTES to
// either stream, or when the optional cancel token trips mid-run.
class PosixProcessRunner : public ProcessRunner {
public:
    static constexpr size_t MAX_OUTPUT_BYTES = 5 * 1024 * 1024;

    explicit PosixProcessRunner(const CancelToken* cancel = nullptr) : cancel_(cancel) {}

    ProcessResult run(const std::vector<std::string>& argv,
                      std::chrono::milliseconds timeout) override;

private:
    const CancelToken* cancel_;
};

// "<argv0> <argv1> ..." for log lines and error messages.
std::string describe_command(const std::vector<std::string>& argv);

// Short human reason for a failed result: "timed out after 10000ms",
// "cancelled", "output exceeded 5 MiB", "exit code 2: <stderr>".
std::string describe_failure(const ProcessResult& r, std::chrono::milliseconds timeout);

} // namespace gatewatch
