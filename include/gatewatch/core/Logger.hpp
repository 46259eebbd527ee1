#pragma once

#include <iosfwd>
#include <mutex>
#include <string>

namespace gatewatch {

// ---------------------------------------------------------------------------
// Logger — injected into every component that reports anything.
//
// Components never write to stdout/stderr directly so tests can capture
// exactly what an operator would see.
// ---------------------------------------------------------------------------
class Logger {
public:
    virtual ~Logger() = default;

    virtual void info(const std::string& msg)  = 0;
    virtual void warn(const std::string& msg)  = 0;
    virtual void error(const std::string& msg) = 0;
    virtual void debug(const std::string& msg) = 0;
};

// Tagged line logger: "[TAG] message". info/debug → out, warn/error → err.
class ConsoleLogger : public Logger {
public:
    explicit ConsoleLogger(std::string tag = "WATCHDOG", bool verbose = false);
    ConsoleLogger(std::ostream& out, std::ostream& err,
                  std::string tag = "WATCHDOG", bool verbose = false);

    void info(const std::string& msg) override;
    void warn(const std::string& msg) override;
    void error(const std::string& msg) override;
    void debug(const std::string& msg) override;

private:
    void write(std::ostream& os, const char* level, const std::string& msg);

    std::ostream& out_;
    std::ostream& err_;
    std::string   tag_;
    bool          verbose_;
    std::mutex    mtx_;
};

} // namespace gatewatch
