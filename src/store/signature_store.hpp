#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;
class Logger;

struct Signature {
    std::string magicHex;   // uppercase, no separators
    uint64_t offset = 0;

    bool operator==(const Signature& other) const {
        return magicHex == other.magicHex && offset == other.offset;
    }
};

struct SignatureRecord {
    std::string extension;
    std::string magicHex;
    uint64_t offset = 0;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;
};

// SQLite-backed table of (extension, magic bytes, offset) records. Every
// mutation is committed immediately. Not safe for concurrent writers.
class SignatureStore {
public:
    SignatureStore(const std::string& dbPath, Logger& logger);
    ~SignatureStore();

    SignatureStore(const SignatureStore&) = delete;
    SignatureStore& operator=(const SignatureStore&) = delete;

    // Records for the extension in insertion order. Throws SignatureNotFound
    // when there are none.
    std::vector<Signature> getSignatures(const std::string& extension);
    std::vector<SignatureRecord> getRecords(const std::string& extension);

    // Throws InvalidInput for an empty extension, an empty or non-hex pattern
    // or a negative offset, and DuplicateSignature when the normalised
    // (extension, pattern, offset) triple is already stored.
    void addSignature(const std::string& extension,
                      const std::string& magicHex,
                      int64_t offset = 0,
                      const std::optional<std::string>& description = std::nullopt,
                      const std::optional<std::string>& mimeType = std::nullopt);

    std::vector<std::string> allExtensions();
    size_t count();

    void close();
    bool isOpen() const { return db != nullptr; }
    const std::string& path() const { return dbPath; }

private:
    void initializeSchema();
    sqlite3* handle(const char* operation);

    std::string dbPath;
    Logger& logger;
    sqlite3* db = nullptr;
};
