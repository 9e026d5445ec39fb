#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

class SignatureStore;
class Logger;

struct LoadReport {
    size_t loaded = 0;
    size_t skipped = 0;
};

// JSON import/export of signature sets:
// {"version": "1.0", "signatures": [{"extension": "pdf", "magic_bytes": "25504446",
//   "offset": 0, "description": "...", "mime_type": "..."}]}
class SignatureLoader {
public:
    explicit SignatureLoader(Logger& logger) : logger(logger) {}

    bool validateSource(const std::string& sourcePath);

    // Throws FileReadError if the file cannot be read and InvalidInput if it
    // is not a signature document. Duplicates and bad entries are skipped.
    LoadReport load(const std::string& sourcePath, SignatureStore& store);

    size_t exportTo(SignatureStore& store, const std::string& outputPath);

private:
    Logger& logger;
};

// Loads the first existing candidate when the store is empty. Returns the
// number of records added.
size_t initializeDefaultSignatures(SignatureStore& store,
                                   const std::vector<std::filesystem::path>& candidates,
                                   Logger& logger);
