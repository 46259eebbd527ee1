#include "gatewatch/core/Logger.hpp"
#include <iostream>
#include <utility>

using namespace gatewatch;

ConsoleLogger::ConsoleLogger(std::string tag, bool verbose)
    : ConsoleLogger(std::cout, std::cerr, std::move(tag), verbose) {}

ConsoleLogger::ConsoleLogger(std::ostream& out, std::ostream& err,
                             std::string tag, bool verbose)
    : out_(out), err_(err), tag_(std::move(tag)), verbose_(verbose) {}

void ConsoleLogger::info(const std::string& msg) {
    write(out_, nullptr, msg);
}

void ConsoleLogger::warn(const std::string& msg) {
    write(err_, "WARN", msg);
}

void ConsoleLogger::error(const std::string& msg) {
    write(err_, "ERROR", msg);
}

void ConsoleLogger::debug(const std::string& msg) {
    if (!verbose_) return;
    write(out_, "DEBUG", msg);
}

void ConsoleLogger::write(std::ostream& os, const char* level, const std::string& msg) {
    // Timer thread and main thread both log. One line per call, never interleaved.
    std::lock_guard<std::mutex> lock(mtx_);
    os << "[" << tag_ << "] ";
    if (level) os << level << " ";
    os << msg << std::endl;
}
