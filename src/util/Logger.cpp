#include "util/Logger.hpp"
#include <iostream>
#include <fstream>
#include <iomanip>
#include <ctime>
#include <mutex>
#include <atomic>
#include <string_view>

namespace shairmeta::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Keep file open for performance
static std::atomic<Logger::Level> log_threshold{Logger::Level::Info};

void Logger::init(Level threshold, const std::filesystem::path& file) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_threshold.store(threshold);

    if (log_file.is_open()) {
        log_file.close();
    }
    if (!file.empty()) {
        log_file.open(file, std::ios::app);
        if (!log_file) {
            std::cerr << "Logger: cannot open log file " << file.string() << ", using stderr only" << std::endl;
        }
    }
}

void Logger::set_threshold(Level threshold) {
    log_threshold.store(threshold);
}

Logger::Level Logger::threshold() {
    return log_threshold.load();
}

void Logger::log(Level level, const std::string& message) {
    if (static_cast<int>(level) < static_cast<int>(log_threshold.load())) return;

    std::string_view level_str;
    switch (level) {
        case Level::Debug: level_str = "[DEBUG] "; break;
        case Level::Info:  level_str = "[INFO]  "; break;
        case Level::Warn:  level_str = "[WARN]  "; break;
        case Level::Error: level_str = "[ERROR] "; break;
    }

    auto now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);

    std::lock_guard<std::mutex> lock(log_mutex);
    std::cerr << std::put_time(&tm, "[%H:%M:%S] ") << level_str << message << '\n';
    if (log_file.is_open()) {
        log_file << std::put_time(&tm, "[%Y-%m-%d %H:%M:%S] ") << level_str << message << '\n';
        log_file.flush();  // Ensure writes are visible immediately
    }
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

std::optional<Logger::Level> Logger::parse_level(const std::string& name) {
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    return std::nullopt;
}

}  // namespace shairmeta::util
