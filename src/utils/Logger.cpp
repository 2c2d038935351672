#include "Logger.h"

#include <atomic>
#include <iostream>
#include <mutex>

namespace Logger {

namespace {
std::mutex console_mutex;
std::atomic<bool> verbose_enabled{false};

void write_line(std::ostream& stream, const std::string& message) {
    std::lock_guard<std::mutex> lock(console_mutex);
    stream << message << std::endl;
}
} // namespace

void setVerbose(bool verbose) {
    verbose_enabled.store(verbose);
}

bool isVerbose() {
    return verbose_enabled.load();
}

void info(const std::string& message) {
    write_line(std::cout, message);
}

void debug(const std::string& message) {
    if (verbose_enabled.load()) {
        write_line(std::cout, message);
    }
}

void warn(const std::string& message) {
    write_line(std::cerr, "Warning: " + message);
}

void error(const std::string& message) {
    write_line(std::cerr, "ERROR: " + message);
}

} // namespace Logger
