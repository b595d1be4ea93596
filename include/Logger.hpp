#pragma once
#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <sstream>
#include <chrono>
#include <iomanip>

namespace PollWatch {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

/**
 * @brief Process-wide logger
 *
 * Starts at INFO on stdout with no file. Level, file and console output are
 * applied by the owner of the process (see main.cpp), never at load time.
 */
class Logger {
public:
    static Logger& getInstance();

    void log(LogLevel level, const std::string& message);
    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    void setLogFile(const std::string& filename);
    void closeLogFile();
    void setConsoleOutput(bool enabled);

    static bool parseLogLevel(const std::string& name, LogLevel& level);
    static std::string levelToString(LogLevel level);

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string getCurrentTimestamp();

    mutable std::mutex mutex_;
    LogLevel minLevel_;
    bool consoleOutput_;
    std::ofstream logFile_;
};

} // namespace PollWatch

#define LOG_DEBUG(msg) PollWatch::Logger::getInstance().log(PollWatch::LogLevel::DEBUG, msg)
#define LOG_INFO(msg) PollWatch::Logger::getInstance().log(PollWatch::LogLevel::INFO, msg)
#define LOG_WARNING(msg) PollWatch::Logger::getInstance().log(PollWatch::LogLevel::WARNING, msg)
#define LOG_ERROR(msg) PollWatch::Logger::getInstance().log(PollWatch::LogLevel::ERROR, msg)
