#include "config.hpp"
#include "utils/helpers.hpp"
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static fs::path homeDir() {
    const char* home = std::getenv("HOME");
    if (home && *home)
        return fs::path(home);
    return fs::temp_directory_path();
}

static fs::path envPath(const char* name, const fs::path& def) {
    const char* value = std::getenv(name);
    return (value && *value) ? fs::path(value) : def;
}

uint64_t parseMaxFileSize(const char* value, Logger& logger) {
    if (!value || !*value)
        return DEFAULT_MAX_FILE_SIZE;

    std::string text(value);
    try {
        size_t used = 0;
        long long size = std::stoll(text, &used);
        if (used != text.size())
            throw std::invalid_argument(text);
        if (size <= 0) {
            logger.warn("Invalid " ENV_MAX_FILE_SIZE ": " + text + " (must be positive). Using default: " +
                        std::to_string(DEFAULT_MAX_FILE_SIZE));
            return DEFAULT_MAX_FILE_SIZE;
        }
        return static_cast<uint64_t>(size);
    } catch (const std::logic_error&) {
        logger.warn("Invalid " ENV_MAX_FILE_SIZE ": " + text + " (must be integer). Using default: " +
                    std::to_string(DEFAULT_MAX_FILE_SIZE));
        return DEFAULT_MAX_FILE_SIZE;
    }
}

AppConfig loadConfig(Logger& logger) {
    AppConfig config;
    config.baseDir = homeDir() / ".hexguard";
    config.dataDir = envPath(ENV_DATA_DIR, config.baseDir / "data");
    config.logDir = envPath(ENV_LOG_DIR, config.baseDir / "log");
    config.dbPath = envPath(ENV_DB_PATH, config.dataDir / "signatures.db");

    const char* level = std::getenv(ENV_LOG_LEVEL);
    config.logLevel = (level && *level) ? parseLogLevel(level) : LogLevel::INFO;
    config.maxFileSize = parseMaxFileSize(std::getenv(ENV_MAX_FILE_SIZE), logger);
    return config;
}

void ensureDirectories(const AppConfig& config) {
    fs::create_directories(config.dataDir);
    fs::create_directories(config.logDir);
    if (config.dbPath.has_parent_path())
        fs::create_directories(config.dbPath.parent_path());
}

std::vector<fs::path> signatureCandidates(const AppConfig& config) {
    std::vector<fs::path> candidates = {
        config.dataDir / "signatures.json",
        fs::current_path() / "data" / "signatures.json",
    };
#ifdef HEXGUARD_DATA_INSTALL_DIR
    candidates.push_back(fs::path(HEXGUARD_DATA_INSTALL_DIR) / "signatures.json");
#endif
    return candidates;
}
