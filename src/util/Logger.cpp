#include "util/Logger.hpp"
#include <atomic>
#include <ctime>
#include <format>
#include <fstream>
#include <iomanip>
#include <mutex>

namespace tickwheel::util {

namespace {

constexpr const char* DEFAULT_LOG_PATH = "/tmp/tickwheel.log";

std::mutex log_mutex;
std::ofstream log_file;  // Keep file open for performance
std::atomic<Logger::Level> min_level{Logger::Level::Info};

}  // namespace

void Logger::init() {
    init(DEFAULT_LOG_PATH, min_level.load());
}

void Logger::init(const std::filesystem::path& path, Level level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    min_level.store(level);
    log_file.open(path, std::ios::trunc);
}

void Logger::set_level(Level level) {
    min_level.store(level);
}

Logger::Level Logger::level() {
    return min_level.load();
}

void Logger::log(Level level, const std::string& message) {
    if (level < min_level.load(std::memory_order_relaxed)) return;

    std::lock_guard<std::mutex> lock(log_mutex);
    if (!log_file.is_open()) {
        // Fallback: open if not initialized
        log_file.open(DEFAULT_LOG_PATH, std::ios::app);
    }
    if (!log_file) return;

    auto now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);

    std::string_view level_str;
    switch (level) {
        case Level::Debug: level_str = "[DEBUG] "; break;
        case Level::Info:  level_str = "[INFO]  "; break;
        case Level::Warn:  level_str = "[WARN]  "; break;
        case Level::Error: level_str = "[ERROR] "; break;
    }

    log_file << std::put_time(&tm, "[%H:%M:%S] ");
    log_file << std::format("{}{}\n", level_str, message);
    log_file.flush();
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

}  // namespace tickwheel::util
