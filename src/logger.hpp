#pragma once
#include <iostream>
#include <fstream>
#include <string>
#include <filesystem>

namespace ansi {
    const std::string reset   = "\033[0m";
    const std::string bold    = "\033[1m";
    const std::string cyan    = "\033[36m";
    const std::string red     = "\033[31m";
    const std::string yellow  = "\033[33m";
    const std::string green   = "\033[32m";
    const std::string magenta = "\033[35m";
    const std::string white   = "\033[37m";
    const std::string gray    = "\033[90m";
}

enum class LogLevel {
    NONE,
    ERROR,
    WARN,
    INFO,
    DEBUG
};

LogLevel parseLogLevel(const std::string& name);
std::string logLevelName(LogLevel level);

// Constructed once by the application and handed to every component by
// reference. Components never configure it themselves.
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::INFO, std::ostream& console = std::cerr);

    void setLevel(LogLevel newLevel) { level = newLevel; }
    LogLevel getLevel() const { return level; }
    void setColor(bool enabled) { color = enabled; }

    // Appends to <dir>/YYYY-MM-DD.log in addition to the console.
    bool openLogFile(const std::filesystem::path& dir);
    std::filesystem::path logFilePath() const { return filePath; }

    void debug(const std::string& msg) { write(LogLevel::DEBUG, ansi::gray, msg); }
    void info(const std::string& msg)  { write(LogLevel::INFO, ansi::white, msg); }
    void warn(const std::string& msg)  { write(LogLevel::WARN, ansi::yellow, msg); }
    void error(const std::string& msg) { write(LogLevel::ERROR, ansi::red, msg); }

    static int cleanupOldLogs(const std::filesystem::path& dir, int maxDays = 30);

private:
    void write(LogLevel msgLevel, const std::string& colorCode, const std::string& msg);

    LogLevel level;
    std::ostream& console;
    bool color = true;
    std::ofstream file;
    std::filesystem::path filePath;
};
