#ifndef CHUNKER_LOGGER_HPP
#define CHUNKER_LOGGER_HPP

#include <string>
#include <fstream>
#include <mutex>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>

// Ordered by severity so a minimum level can filter everything below it.
enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static Logger& instance();

    // Opens (appends to) a log file in addition to the console.
    void init(const std::string& filename);
    void log(LogLevel level, const std::string& message);

    // Stops writing to the log file opened by init(), if any.
    void close();

    void set_level(LogLevel level);
    LogLevel level() const;

    // Helper for easy logging
    template<typename... Args>
    void log_args(LogLevel level, Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        log(level, ss.str());
    }

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::ofstream log_file_;
    mutable std::mutex mutex_;
    LogLevel level_;
    bool stdout_is_tty_;
    bool stderr_is_tty_;

    std::string level_to_string(LogLevel level);
    std::string get_timestamp();
};

// Global macros for easier usage
#define LOG_INFO(...) Logger::instance().log_args(LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...) Logger::instance().log_args(LogLevel::WARNING, __VA_ARGS__)
#define LOG_ERR(...)  Logger::instance().log_args(LogLevel::ERROR, __VA_ARGS__)
#define LOG_DEBUG(...) Logger::instance().log_args(LogLevel::DEBUG, __VA_ARGS__)

#endif // CHUNKER_LOGGER_HPP
