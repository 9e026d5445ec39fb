#include "cli.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "validator.hpp"
#include "readers/reader_selector.hpp"
#include "store/signature_store.hpp"
#include "utils/helpers.hpp"
#include "utils/signature_loader.hpp"
#include <algorithm>
#include <cstdint>
#include <optional>

namespace fs = std::filesystem;

void printUsage(std::ostream& out) {
    out << "Usage: hexguard [-d] <command> [options] [args]\n"
        << "\n"
        << "Commands:\n"
        << "  scan <file> [-v] [--hash]         Validate that a file matches its extension\n"
        << "  scan-dir <dir> [-r] [-e ext]...   Validate every file in a directory\n"
        << "  hash <file>                       Print the SHA-256 digest of a file\n"
        << "  list                              List supported file types\n"
        << "  status [-v]                       Show store location and statistics\n"
        << "  add <ext> <hex> [--offset N] [--description S] [--mime S]\n"
        << "                                    Register a signature\n"
        << "  import <file.json>                Load signatures from JSON\n"
        << "  export <file.json>                Write all signatures to JSON\n"
        << "\n"
        << "Options:\n"
        << "  -v, --verbose   Verbose output\n"
        << "  -r, --recursive Recurse into subdirectories (scan-dir)\n"
        << "  -e, --ext EXT   Only scan files with this extension (repeatable)\n"
        << "  -d, --debug     Enable debug logging\n"
        << "  -h, --help      Show this help message\n"
        << "  --version       Show version\n";
}

ArgParser buildParser() {
    ArgParser args;
    args.addOption("-h", false, "help");
    args.addOption("--help", false, "help");

    args.addOption("--version", false, "version");

    args.addOption("-d", false, "debug");
    args.addOption("--debug", false, "debug");

    args.addOption("-v", false, "verbose");
    args.addOption("--verbose", false, "verbose");

    args.addOption("--hash", false, "hash");

    args.addOption("-r", false, "recursive");
    args.addOption("--recursive", false, "recursive");

    args.addOption("-e", true, "ext");
    args.addOption("--ext", true, "ext");

    args.addOption("--offset", true, "offset");
    args.addOption("--description", true, "description");
    args.addOption("--mime", true, "mime");
    return args;
}

int exitCodeFor(const ValidationOutcome& outcome) {
    switch (outcome.status) {
        case OutcomeStatus::Valid:
            return EXIT_OK;
        case OutcomeStatus::Invalid:
            return EXIT_INVALID;
        case OutcomeStatus::Fault:
            break;
    }
    switch (outcome.fault) {
        case FaultKind::FileRead:          return EXIT_FILE_ERROR;
        case FaultKind::SignatureNotFound: return EXIT_UNKNOWN_TYPE;
        default:                           return EXIT_ERROR;
    }
}

std::vector<fs::path> collectFiles(const fs::path& dir,
                                   bool recursive,
                                   const std::set<std::string>& extensions,
                                   ScanSummary& summary,
                                   Logger& logger) {
    std::vector<fs::path> files;
    std::vector<fs::path> pending{dir};

    while (!pending.empty()) {
        fs::path current = pending.back();
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(current, ec), end;
        for (; !ec && it != end; it.increment(ec)) {
            std::error_code statusEc;
            if (it->is_directory(statusEc)) {
                // symlinked directories are not followed
                if (recursive && !it->is_symlink(statusEc))
                    pending.push_back(it->path());
                continue;
            }
            if (!it->is_regular_file(statusEc))
                continue;
            if (!extensions.empty() && !extensions.count(extension_of(it->path().string())))
                continue;
            files.push_back(it->path());
        }

        if (ec) {
            logger.warn("Cannot read directory '" + current.string() + "': " + ec.message());
            summary.errors++;
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

void scanFiles(Validator& validator, const std::vector<fs::path>& files,
               bool verbose, ScanSummary& summary) {
    for (const auto& file : files) {
        ValidationOutcome outcome = validator.inspect(file.string());
        if (outcome.valid()) {
            summary.valid++;
            if (verbose)
                printValidationResult(outcome, false);
            continue;
        }

        bool isError = outcome.status == OutcomeStatus::Fault &&
                       outcome.fault != FaultKind::SignatureNotFound;
        if (isError)
            summary.errors++;
        else
            summary.invalid++;
        printValidationResult(outcome, verbose);
    }
}

static const std::string& requireArg(const ArgParser& args, size_t index, const char* what) {
    if (args.positional.size() <= index)
        throw UsageError(std::string("Missing argument: ") + what);
    return args.positional[index];
}

static void ensureSignatures(SignatureStore& store, const AppConfig& config, Logger& logger) {
    if (store.count() > 0)
        return;
    printInfo("Initializing signature database...");
    size_t loaded = initializeDefaultSignatures(store, signatureCandidates(config), logger);
    if (loaded > 0)
        printInfo("Loaded " + std::to_string(loaded) + " file signatures");
}

static int cmdScan(const ArgParser& args, Validator& validator) {
    const std::string& file = requireArg(args, 1, "file");
    bool verbose = args.has("verbose");
    if (verbose)
        printInfo("Scanning: " + file);

    ValidationOutcome outcome = validator.inspect(file);
    printValidationResult(outcome, verbose);
    if (!outcome.valid())
        return exitCodeFor(outcome);

    if (args.has("hash"))
        printFileHash(file, validator.computeDigest(file));
    return EXIT_OK;
}

static int cmdScanDir(const ArgParser& args, Validator& validator, Logger& logger) {
    fs::path dir = requireArg(args, 1, "directory");
    bool verbose = args.has("verbose");

    std::error_code ec;
    if (!fs::is_directory(dir, ec))
        throw FileReadError("Not a directory: '" + dir.string() + "'");

    std::set<std::string> filter;
    for (const auto& ext : args.getAll("ext"))
        filter.insert(normalize_extension(ext));

    ScanSummary summary;
    std::vector<fs::path> files = collectFiles(dir, args.has("recursive"), filter, summary, logger);
    if (files.empty() && summary.errors == 0) {
        printInfo("No files found in " + dir.string());
        return EXIT_OK;
    }
    printInfo("Scanning " + std::to_string(files.size()) + " files...");

    scanFiles(validator, files, verbose, summary);
    printScanSummary(summary);
    return (summary.invalid == 0 && summary.errors == 0) ? EXIT_OK : EXIT_INVALID;
}

static int64_t parseOffset(const std::string& text) {
    try {
        size_t used = 0;
        long long value = std::stoll(text, &used);
        if (used != text.size())
            throw UsageError("Invalid offset: " + text);
        return value;
    } catch (const std::logic_error&) {
        throw UsageError("Invalid offset: " + text);
    }
}

static int cmdAdd(const ArgParser& args, SignatureStore& store) {
    const std::string& ext = requireArg(args, 1, "extension");
    const std::string& hex = requireArg(args, 2, "magic bytes");

    int64_t offset = args.has("offset") ? parseOffset(args.get("offset")) : 0;

    std::optional<std::string> description;
    std::optional<std::string> mime;
    if (args.has("description"))
        description = args.get("description");
    if (args.has("mime"))
        mime = args.get("mime");

    store.addSignature(ext, hex, offset, description, mime);
    printInfo("Added signature for '." + normalize_extension(ext) + "': " + normalize_hex(hex) +
              " at offset " + std::to_string(offset));
    return EXIT_OK;
}

static int dispatch(const ArgParser& args, const AppConfig& config, Logger& logger) {
    if (args.positional.empty())
        throw UsageError("Missing command");
    const std::string& command = args.positional.front();

    SignatureStore store(config.dbPath.string(), logger);
    ReaderSelector selector(logger);
    Validator validator(store, selector, logger, config.maxFileSize);

    int code = EXIT_OK;
    if (command == "scan") {
        ensureSignatures(store, config, logger);
        code = cmdScan(args, validator);
    } else if (command == "scan-dir") {
        ensureSignatures(store, config, logger);
        code = cmdScanDir(args, validator, logger);
    } else if (command == "hash") {
        const std::string& file = requireArg(args, 1, "file");
        printFileHash(file, validator.computeDigest(file));
    } else if (command == "list") {
        ensureSignatures(store, config, logger);
        printSignatureList(store);
    } else if (command == "status") {
        printStatus(store, config, args.has("verbose"));
    } else if (command == "add") {
        code = cmdAdd(args, store);
    } else if (command == "import") {
        SignatureLoader loader(logger);
        LoadReport report = loader.load(requireArg(args, 1, "file"), store);
        printInfo("Loaded " + std::to_string(report.loaded) + " signatures, skipped " +
                  std::to_string(report.skipped));
    } else if (command == "export") {
        ensureSignatures(store, config, logger);
        SignatureLoader loader(logger);
        size_t count = loader.exportTo(store, requireArg(args, 1, "file"));
        printInfo("Exported " + std::to_string(count) + " signatures");
    } else {
        throw UsageError("Unknown command: " + command);
    }

    validator.close();
    return code;
}

int runCommand(const ArgParser& args, const AppConfig& config, Logger& logger) {
    try {
        return dispatch(args, config, logger);
    } catch (const UsageError& e) {
        printError(e.what());
        printUsage();
        return EXIT_USAGE;
    } catch (const ValidationError& e) {
        printError(std::string("Validation failed: ") + e.what());
        return EXIT_INVALID;
    } catch (const FileReadError& e) {
        printError(std::string("File error: ") + e.what());
        return EXIT_FILE_ERROR;
    } catch (const SignatureNotFound& e) {
        printError(std::string("Unknown file type: ") + e.what());
        return EXIT_UNKNOWN_TYPE;
    } catch (const HexGuardError& e) {
        printError(e.what());
        return EXIT_ERROR;
    } catch (const fs::filesystem_error& e) {
        printError(e.what());
        return EXIT_ERROR;
    }
}
