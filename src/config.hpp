#pragma once
#include "logger.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#define HEXGUARD_NAME "HexGuard"
#define HEXGUARD_VERSION "0.1.0"

#define ENV_DB_PATH       "HEXGUARD_DB_PATH"
#define ENV_DATA_DIR      "HEXGUARD_DATA_DIR"
#define ENV_LOG_DIR       "HEXGUARD_LOG_DIR"
#define ENV_LOG_LEVEL     "HEXGUARD_LOG_LEVEL"
#define ENV_MAX_FILE_SIZE "HEXGUARD_MAX_FILE_SIZE"

#define MAX_LOG_FILES 30

struct AppConfig {
    std::filesystem::path baseDir;
    std::filesystem::path dataDir;
    std::filesystem::path logDir;
    std::filesystem::path dbPath;
    LogLevel logLevel = LogLevel::INFO;
    uint64_t maxFileSize = 0;
};

// Resolves paths and limits from HEXGUARD_* variables, defaulting to
// $HOME/.hexguard/{data,log}. Bad values are reported on the logger.
AppConfig loadConfig(Logger& logger);

// Parses a positive byte count; falls back to the default with a warning.
uint64_t parseMaxFileSize(const char* value, Logger& logger);

void ensureDirectories(const AppConfig& config);

// Places searched for the bundled signatures.json, in order.
std::vector<std::filesystem::path> signatureCandidates(const AppConfig& config);
