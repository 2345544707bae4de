#include "util/log.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace panelpress {
namespace log {

namespace {

std::mutex log_mutex;
std::ofstream log_file;
bool verbose_enabled = false;
bool quiet_enabled = false;

std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t);
#else
    localtime_r(&time_t, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

const char* level_tag(Level level) {
    switch (level) {
        case Level::Debug: return "Debug";
        case Level::Info: return "Info";
        case Level::Warning: return "Warning";
        case Level::Error: return "Error";
    }
    return "Info";
}

}

void init(const std::string& file_path, bool verbose) {
    std::lock_guard<std::mutex> lock(log_mutex);
    verbose_enabled = verbose;
    if (log_file.is_open()) {
        log_file.close();
    }
    if (file_path.empty()) {
        return;
    }
    log_file.open(file_path, std::ios::app);
    if (!log_file.is_open()) {
        std::cerr << "Warning: cannot open log file " << file_path << std::endl;
    }
}

void close() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
}

void set_quiet(bool quiet) {
    std::lock_guard<std::mutex> lock(log_mutex);
    quiet_enabled = quiet;
}

void write(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level == Level::Debug && !verbose_enabled) {
        return;
    }
    std::string line = "[" + get_timestamp() + "] " + level_tag(level) + ": " + message;
    if (!quiet_enabled || level == Level::Error) {
        std::cerr << line << '\n';
    }
    if (log_file.is_open()) {
        log_file << line << '\n';
        log_file.flush();
    }
}

}
}
