#include "gatewatch/process/ProcessRunner.hpp"
#include "gatewatch/core/CancelToken.hpp"
#include "gatewatch/core/Errors.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>

using namespace gatewatch;

namespace {

struct Pipe {
    int rd = -1;
    int wr = -1;

    void close_rd() { if (rd >= 0) { ::close(rd); rd = -1; } }
    void close_wr() { if (wr >= 0) { ::close(wr); wr = -1; } }
    ~Pipe() { close_rd(); close_wr(); }
};

void open_pipe(Pipe& p) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw ProcessError(std::string("pipe failed: ") + std::strerror(errno));
    }
    p.rd = fds[0];
    p.wr = fds[1];
    ::fcntl(p.rd, F_SETFL, ::fcntl(p.rd, F_GETFL) | O_NONBLOCK);
}

// Reads whatever is available. Returns false once the write end is closed.
// Stops at the cap and flags `overflow`; the rest is left unread.
bool drain(int fd, std::string& sink, bool& overflow) {
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            size_t room = PosixProcessRunner::MAX_OUTPUT_BYTES > sink.size()
                ? PosixProcessRunner::MAX_OUTPUT_BYTES - sink.size() : 0;
            sink.append(buf, std::min(room, static_cast<size_t>(n)));
            if (static_cast<size_t>(n) > room) {
                overflow = true;
                return true;   // caller kills the child
            }
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

} // namespace

ProcessResult PosixProcessRunner::run(const std::vector<std::string>& argv,
                                      std::chrono::milliseconds timeout) {
    if (argv.empty()) throw ProcessError("empty command");

    ProcessResult result;
    if (cancel_ && cancel_->cancelled()) {
        result.cancelled = true;
        return result;
    }

    Pipe out_pipe, err_pipe;
    open_pipe(out_pipe);
    open_pipe(err_pipe);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw ProcessError(std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        ::dup2(out_pipe.wr, STDOUT_FILENO);
        ::dup2(err_pipe.wr, STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::execvp(args[0], args.data());
        // exec failed. Only async-signal-safe calls from here.
        const char msg[] = "exec failed\n";
        ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        ::_exit(127);
    }

    out_pipe.close_wr();
    err_pipe.close_wr();

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool out_open = true;
    bool err_open = true;
    bool exited   = false;
    int  status   = 0;

    for (;;) {
        if (!exited) {
            pid_t r = ::waitpid(pid, &status, WNOHANG);
            if (r == pid) exited = true;
        }

        if (exited) {
            // Child is gone. Take what is buffered and stop — a grandchild
            // holding the pipe open must not stall the tick.
            if (out_open) drain(out_pipe.rd, result.out, result.output_overflow);
            if (err_open) drain(err_pipe.rd, result.err, result.output_overflow);
            break;
        }

        auto now = std::chrono::steady_clock::now();
        const bool cancelled = cancel_ && cancel_->cancelled();
        if (now >= deadline || cancelled || result.output_overflow) {
            ::kill(pid, SIGKILL);
            ::waitpid(pid, &status, 0);
            if (out_open) drain(out_pipe.rd, result.out, result.output_overflow);
            if (err_open) drain(err_pipe.rd, result.err, result.output_overflow);
            // Overflow wins over a deadline that passed meanwhile.
            if (!result.output_overflow) {
                if (cancelled) result.cancelled = true;
                else           result.timed_out = true;
            }
            result.exit_code = -1;
            return result;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int wait_ms = static_cast<int>(std::min<long long>(remaining.count(), 50));

        pollfd fds[2];
        nfds_t nfds = 0;
        if (out_open) fds[nfds++] = {out_pipe.rd, POLLIN, 0};
        if (err_open) fds[nfds++] = {err_pipe.rd, POLLIN, 0};

        int rc = ::poll(nfds ? fds : nullptr, nfds, wait_ms);
        if (rc < 0 && errno != EINTR) {
            ::kill(pid, SIGKILL);
            ::waitpid(pid, &status, 0);
            throw ProcessError(std::string("poll failed: ") + std::strerror(errno));
        }
        if (rc <= 0) continue;

        if (out_open) out_open = drain(out_pipe.rd, result.out, result.output_overflow);
        if (err_open) err_open = drain(err_pipe.rd, result.err, result.output_overflow);
    }

    result.exit_code = decode_status(status);
    return result;
}

std::string gatewatch::describe_command(const std::vector<std::string>& argv) {
    std::ostringstream ss;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i) ss << ' ';
        ss << argv[i];
    }
    return ss.str();
}

std::string gatewatch::describe_failure(const ProcessResult& r, std::chrono::milliseconds timeout) {
    if (r.timed_out) {
        return "timed out after " + std::to_string(timeout.count()) + "ms";
    }
    if (r.cancelled) return "cancelled";
    if (r.output_overflow) return "output exceeded 5 MiB";
    std::string msg = r.exit_code < 0 ? std::string("terminated by signal")
                                      : "exit code " + std::to_string(r.exit_code);
    std::string err = r.err;
    while (!err.empty() && (err.back() == '\n' || err.back() == '\r')) err.pop_back();
    if (!err.empty()) msg += ": " + err;
    return msg;
}
