#include "log.hpp"

#include <atomic>
#include <chrono>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace {

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

tasksync::log::Level& global_level() {
    static tasksync::log::Level lvl = tasksync::log::Level::Warn;
    return lvl;
}

std::atomic<bool>& env_init_flag() {
    static std::atomic<bool> f{false};
    return f;
}

std::unique_ptr<std::ofstream>& file_sink() {
    static std::unique_ptr<std::ofstream> f{};
    return f;
}

std::chrono::steady_clock::time_point& time_origin() {
    static auto t0 = std::chrono::steady_clock::now();
    return t0;
}

bool open_file_sink(const std::string& path, bool append) {
    if (path.empty()) {
        file_sink().reset();
        return true;
    }
    std::ios_base::openmode mode = std::ios::out;
    if (append) mode |= std::ios::app; else mode |= std::ios::trunc;
    auto ofs = std::make_unique<std::ofstream>(path, mode);
    if (!ofs->good()) {
        return false;
    }
    file_sink() = std::move(ofs);
    return true;
}

bool truthy(const char* v) {
    return v && (*v == '1' || *v == 'y' || *v == 'Y' || *v == 't' || *v == 'T');
}

void init_from_env_once() {
    bool expected = false;
    if (!env_init_flag().compare_exchange_strong(expected, true)) {
        return;
    }
    if (const char* v = std::getenv("TASKSYNC_LOG_LEVEL")) {
        global_level() = tasksync::log::parse_level(v, global_level());
    }

    const char* file = std::getenv("TASKSYNC_LOG_FILE");
    if (file && *file) {
        open_file_sink(file, truthy(std::getenv("TASKSYNC_LOG_APPEND")));
    }
}

const char* level_tag(tasksync::log::Level level) {
    switch (level) {
        case tasksync::log::Level::Error: return "ERROR";
        case tasksync::log::Level::Warn:  return "WARN";
        case tasksync::log::Level::Info:  return "INFO";
        case tasksync::log::Level::Debug: return "DEBUG";
        default:                return "INFO";
    }
}

void log_line_impl(tasksync::log::Level level, const std::string& message) {
    init_from_env_once();
    if (static_cast<int>(level) > static_cast<int>(global_level())) {
        return;
    }
    using namespace std::chrono;
    const auto now = steady_clock::now();
    const double secs = duration_cast<duration<double>>(now - time_origin()).count();
    std::lock_guard<std::mutex> lock(log_mutex());
    // stdout belongs to command output.
    std::ostream& os = std::cerr;
    const std::string line = std::string("[") + level_tag(level) + "] +" +
        [&]() { std::ostringstream ss; ss.setf(std::ios::fixed); ss << std::setprecision(3) << secs; return ss.str(); }() +
        "s: " + message + '\n';
    os << line;
    os.flush();
    if (file_sink()) {
        (*file_sink()) << line;
        file_sink()->flush();
    }
}

}

namespace tasksync::log {

void set_level(Level level) {
    init_from_env_once();
    std::lock_guard<std::mutex> lock(log_mutex());
    global_level() = level;
}

Level level() {
    init_from_env_once();
    return global_level();
}

Level parse_level(const std::string& value, Level fallback) {
    std::string lower = value;
    for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "error") return Level::Error;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "info") return Level::Info;
    if (lower == "debug") return Level::Debug;
    return fallback;
}

bool set_file(const std::string& path, bool append) {
    init_from_env_once();
    std::lock_guard<std::mutex> lock(log_mutex());
    return open_file_sink(path, append);
}

void error(const std::string& message) { log_line_impl(Level::Error, message); }
void warn (const std::string& message) { log_line_impl(Level::Warn,  message); }
void info (const std::string& message) { log_line_impl(Level::Info,  message); }
void debug(const std::string& message) { log_line_impl(Level::Debug, message); }

}
