#ifndef INTENTIONAL_LOGGER_HPP
#define INTENTIONAL_LOGGER_HPP

#include <string>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <mutex>
#include <chrono>
#include <iomanip>

namespace intentional {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static Logger& instance();

    // Opens the session log. Console output always goes to stderr because
    // stdout may be the native messaging channel.
    void init(const std::filesystem::path& logPath, bool verbose, const std::string& role = "");
    void log(LogLevel level, const std::string& message);

    // Deletes the oldest "<prefix>*.log" files in dir, keeping `keep` of them
    static void pruneLogs(const std::filesystem::path& dir, const std::string& prefix, size_t keep);

    bool verbose() const { return verbose_; }

    // Forbidden
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;
    ~Logger();

    std::ofstream logFile_;
    bool verbose_ = false;
    std::string role_;
    std::mutex mutex_;

    std::string getTimestamp();
    std::string getLevelString(LogLevel level);
};

// Convenience macros
#define LOG_DEBUG(msg) intentional::Logger::instance().log(intentional::LogLevel::DEBUG, msg)
#define LOG_INFO(msg) intentional::Logger::instance().log(intentional::LogLevel::INFO, msg)
#define LOG_WARN(msg) intentional::Logger::instance().log(intentional::LogLevel::WARNING, msg)
#define LOG_ERROR(msg) intentional::Logger::instance().log(intentional::LogLevel::ERROR, msg)

} // namespace intentional

#endif // INTENTIONAL_LOGGER_HPP
