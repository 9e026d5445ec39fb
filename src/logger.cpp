#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

LogLevel parseLogLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "NONE")    return LogLevel::NONE;
    if (upper == "ERROR")   return LogLevel::ERROR;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "DEBUG")   return LogLevel::DEBUG;
    return LogLevel::INFO;
}

std::string logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::NONE:  return "NONE";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "INFO";
}

static std::string formatNow(const char* fmt) {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&t, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, fmt);
    return oss.str();
}

Logger::Logger(LogLevel level, std::ostream& console)
    : level(level), console(console) {}

bool Logger::openLogFile(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        error("Cannot create log directory " + dir.string() + ": " + ec.message());
        return false;
    }
    fs::path target = dir / (formatNow("%Y-%m-%d") + ".log");
    file.open(target, std::ios::app);
    if (!file) {
        error("Cannot open log file " + target.string());
        return false;
    }
    filePath = target;
    return true;
}

void Logger::write(LogLevel msgLevel, const std::string& colorCode, const std::string& msg) {
    if (level < msgLevel)
        return;

    std::string tag = "[" + logLevelName(msgLevel) + "] ";
    if (color)
        console << colorCode << tag << msg << ansi::reset << "\n";
    else
        console << tag << msg << "\n";

    if (file.is_open()) {
        std::string name = logLevelName(msgLevel);
        name.resize(8, ' ');
        file << formatNow("%Y-%m-%d %H:%M:%S") << " | " << name << " | " << msg << "\n";
        file.flush();
    }
}

// Log files are named YYYY-MM-DD.log; anything else in the directory is ignored.
int Logger::cleanupOldLogs(const fs::path& dir, int maxDays) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec))
        return 0;

    std::time_t cutoff = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::now() - std::chrono::hours(24 * maxDays));

    int deleted = 0;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".log")
            continue;

        std::tm date{};
        std::istringstream stem(entry.path().stem().string());
        stem >> std::get_time(&date, "%Y-%m-%d");
        if (stem.fail() || stem.peek() != std::char_traits<char>::eof())
            continue;

        date.tm_isdst = -1;
        std::time_t fileTime = std::mktime(&date);
        if (fileTime == static_cast<std::time_t>(-1) || fileTime >= cutoff)
            continue;

        std::error_code removeEc;
        if (fs::remove(entry.path(), removeEc))
            ++deleted;
    }
    return deleted;
}
