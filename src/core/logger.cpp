#include "intentional/logger.hpp"
#include <algorithm>
#include <sstream>
#include <unistd.h>
#include <vector>

namespace intentional {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::init(const std::filesystem::path& logPath, bool verbose, const std::string& role) {
    std::lock_guard<std::mutex> lock(mutex_);
    verbose_ = verbose;
    role_ = role;

    if (logFile_.is_open()) {
        logFile_.close();
    }

    std::error_code ec;
    if (logPath.has_parent_path()) {
        std::filesystem::create_directories(logPath.parent_path(), ec);
    }

    logFile_.open(logPath, std::ios::out | std::ios::app);
    if (!logFile_.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << logPath << std::endl;
    } else {
        logFile_ << "\n=== Intentional " << (role_.empty() ? "" : role_ + " ")
                 << "Session Started: " << getTimestamp() << " (pid " << ::getpid() << ") ===\n";
        logFile_.flush();
    }
}

Logger::~Logger() {
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string timestamp = getTimestamp();
    std::string levelStr = getLevelString(level);
    std::string formattedMsg = "[" + timestamp + "] [" + levelStr + "] " + message;

    if (logFile_.is_open()) {
        logFile_ << formattedMsg << std::endl;
    }

    if (verbose_ || level == LogLevel::WARNING || level == LogLevel::ERROR) {
        std::cerr << formattedMsg << std::endl;
    }
}

void Logger::pruneLogs(const std::filesystem::path& dir, const std::string& prefix, size_t keep) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) return;

    std::vector<std::filesystem::path> logs;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        std::string name = entry.path().filename().string();
        if (name.rfind(prefix, 0) == 0 && entry.path().extension() == ".log") {
            logs.push_back(entry.path());
        }
    }
    if (logs.size() <= keep) return;

    // Timestamped names sort chronologically
    std::sort(logs.begin(), logs.end());
    for (size_t i = 0; i + keep < logs.size(); ++i) {
        std::filesystem::remove(logs[i], ec);
    }
}

std::string Logger::getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::localtime(&in_time_t), "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string Logger::getLevelString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR:   return "ERROR";
        default:                return "UNKNOWN";
    }
}

} // namespace intentional
