#pragma once
#include "validationresult.hpp"
#include "utils/helpers.hpp"
#include <cstdint>
#include <string>

class SignatureStore;
class ReaderSelector;
class BaseReader;
class Logger;
struct Signature;

// Checks that a file's leading bytes (and, for containers, its internal
// layout) agree with its extension. Borrows the store and selector; both
// must outlive the validator.
class Validator {
public:
    Validator(SignatureStore& store, ReaderSelector& selector, Logger& logger,
              uint64_t maxFileSize = DEFAULT_MAX_FILE_SIZE);

    // Tagged result. Mismatches come back as Invalid, missing files, unknown
    // extensions and store faults as Fault; none of these throw.
    ValidationOutcome inspect(const std::string& filePath);

    // true on success, otherwise throws FileReadError, ValidationError,
    // SignatureNotFound, InvalidSignature or StoreError.
    bool validate(const std::string& filePath);

    // SHA-256 of the full file content.
    std::string computeDigest(const std::string& filePath);

    void close();

    uint64_t maxFileSize() const { return maxSize; }

private:
    ValidationOutcome match(const std::string& filePath, const std::string& extension);
    bool checkSignature(BaseReader& reader, const std::string& filePath, const Signature& signature);

    SignatureStore& store;
    ReaderSelector& selector;
    Logger& logger;
    uint64_t maxSize;
};
