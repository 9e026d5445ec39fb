#include "cli.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "utils/printer.hpp"
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

int main(int argc, char* argv[]) {
    Logger logger(LogLevel::INFO);

    ArgParser args = buildParser();
    try {
        args.parse(argc, argv);
    } catch (const UsageError& e) {
        printError(e.what());
        printUsage();
        return EXIT_USAGE;
    }

    if (args.has("version")) {
        std::cout << HEXGUARD_NAME << " " << HEXGUARD_VERSION << "\n";
        return EXIT_OK;
    }
    if (args.has("help") || args.positional.empty()) {
        printUsage();
        return args.has("help") ? EXIT_OK : EXIT_USAGE;
    }

    AppConfig config = loadConfig(logger);
    logger.setLevel(args.has("debug") ? LogLevel::DEBUG : config.logLevel);

    try {
        ensureDirectories(config);
    } catch (const fs::filesystem_error& e) {
        printError(e.what());
        return EXIT_ERROR;
    }
    if (logger.openLogFile(config.logDir))
        Logger::cleanupOldLogs(config.logDir, MAX_LOG_FILES);
    logger.debug(std::string(HEXGUARD_NAME) + " " + HEXGUARD_VERSION + ", store " + config.dbPath.string());

    return runCommand(args, config, logger);
}
