#pragma once

#include <string>
#include <mutex>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

inline constexpr const char* kDefaultLogPath = "/tmp/azsnap.log";

// Process-wide logger. Every line goes to the log file; lines are echoed to
// stdout (stderr for ERROR and above) unless console output is disabled.
class Logger {
public:
    static bool initialize(const std::string& logPath = kDefaultLogPath, LogLevel level = LogLevel::INFO);
    static void shutdown();
    static bool isInitialized() { return initialized_; }

    static void setLogLevel(LogLevel level);
    static LogLevel getLogLevel();
    static std::string getLogPath();
    static void setConsoleOutput(bool enabled);

    // Tag added to every line, e.g. the ticket reference of the current run.
    // Empty disables it.
    static void setRunTag(const std::string& tag);

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warning(const std::string& message);
    static void error(const std::string& message);
    static void fatal(const std::string& message);

    // Accepts DEBUG, INFO, WARNING (or WARN), ERROR, FATAL in any case
    static bool parseLevel(const std::string& text, LogLevel& level);
    static std::string levelToString(LogLevel level);

private:
    static void log(LogLevel level, const std::string& message);
    static std::string formatLine(LogLevel level, const std::string& message);

    static std::mutex mutex_;
    static LogLevel currentLevel_;
    static bool initialized_;
    static bool consoleOutput_;
    static std::string logPath_;
    static std::string runTag_;
};
