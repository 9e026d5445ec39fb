#include "validator.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "readers/reader_selector.hpp"
#include "store/signature_store.hpp"
#include "utils/digest.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

static const size_t DIAGNOSTIC_BYTES = 8;

std::string faultKindName(FaultKind kind) {
    switch (kind) {
        case FaultKind::None:              return "none";
        case FaultKind::FileRead:          return "file read error";
        case FaultKind::SignatureNotFound: return "signature not found";
        case FaultKind::InvalidSignature:  return "invalid signature";
        case FaultKind::Store:             return "store error";
    }
    return "unknown";
}

static ValidationOutcome fault(ValidationOutcome outcome, FaultKind kind, const std::string& msg) {
    outcome.status = OutcomeStatus::Fault;
    outcome.fault = kind;
    outcome.message = msg;
    return outcome;
}

Validator::Validator(SignatureStore& store, ReaderSelector& selector, Logger& logger, uint64_t maxFileSize)
    : store(store), selector(selector), logger(logger), maxSize(maxFileSize) {
    logger.debug("Validator ready, max file size " + std::to_string(maxSize) + " bytes");
}

ValidationOutcome Validator::inspect(const std::string& filePath) {
    logger.info("Validating file: " + filePath);

    ValidationOutcome outcome;
    outcome.filePath = filePath;

    std::error_code ec;
    fs::file_status st = fs::status(filePath, ec);
    if (!fs::exists(st)) {
        logger.error("File not found: '" + filePath + "'");
        return fault(outcome, FaultKind::FileRead, "File not found: '" + filePath + "'");
    }
    if (!fs::is_regular_file(st)) {
        logger.error("Path is not a file: '" + filePath + "'");
        return fault(outcome, FaultKind::FileRead, "Path is not a file: '" + filePath + "'");
    }

    uintmax_t size = fs::file_size(filePath, ec);
    if (ec) {
        std::string msg = "Failed to stat file '" + filePath + "': " + ec.message();
        logger.error(msg);
        return fault(outcome, FaultKind::FileRead, msg);
    }
    if (size > maxSize) {
        std::string msg = "File too large: " + std::to_string(size) + " bytes (max: " +
                          std::to_string(maxSize) + ")";
        logger.error(msg);
        return fault(outcome, FaultKind::FileRead, msg);
    }
    logger.debug("File size: " + std::to_string(size) + " bytes");

    std::string extension = extension_of(filePath);
    if (extension.empty()) {
        outcome.status = OutcomeStatus::Invalid;
        outcome.message = "File has no extension: '" + filePath + "'";
        logger.error(outcome.message);
        return outcome;
    }
    logger.debug("File extension: ." + extension);

    try {
        return match(filePath, extension);
    } catch (const FileReadError& e) {
        outcome.extension = extension;
        return fault(outcome, FaultKind::FileRead, e.what());
    } catch (const SignatureNotFound& e) {
        outcome.extension = extension;
        return fault(outcome, FaultKind::SignatureNotFound, e.what());
    } catch (const InvalidSignature& e) {
        outcome.extension = extension;
        return fault(outcome, FaultKind::InvalidSignature, e.what());
    } catch (const StoreError& e) {
        outcome.extension = extension;
        return fault(outcome, FaultKind::Store, e.what());
    }
}

// Records are tried in store order. The first magic-byte match decides: its
// structure check either accepts the file or rejects it outright.
ValidationOutcome Validator::match(const std::string& filePath, const std::string& extension) {
    ValidationOutcome outcome;
    outcome.filePath = filePath;
    outcome.extension = extension;

    BaseReader& reader = selector.select(extension);
    std::vector<Signature> signatures = store.getSignatures(extension);
    logger.debug("Checking " + std::to_string(signatures.size()) + " signature(s)");

    std::string lastExpected;
    size_t lastLength = 0;
    for (const auto& signature : signatures) {
        lastExpected = signature.magicHex;
        lastLength = signature.magicHex.size() / 2;
        if (!checkSignature(reader, filePath, signature))
            continue;

        if (reader.validateStructure(filePath, extension)) {
            outcome.status = OutcomeStatus::Valid;
            outcome.message = "File '" + filePath + "' validated successfully as '." + extension + "'";
            logger.info(outcome.message);
            return outcome;
        }

        outcome.status = OutcomeStatus::Invalid;
        outcome.structureFailed = true;
        outcome.expectedHex = signature.magicHex;
        outcome.message = "File '" + filePath + "' has correct magic bytes for '." + extension +
                          "' but failed internal structure validation";
        logger.error(outcome.message);
        return outcome;
    }

    std::vector<uint8_t> actual = reader.readBytes(filePath, std::max(DIAGNOSTIC_BYTES, lastLength), 0);
    outcome.status = OutcomeStatus::Invalid;
    outcome.expectedHex = lastExpected;
    outcome.actualHex = bytes_to_hex(actual);
    outcome.message = "File '" + filePath + "' has extension '." + extension +
                      "' but magic bytes don't match. Expected: " + outcome.expectedHex +
                      ", Found: " + outcome.actualHex;
    logger.error(outcome.message);
    return outcome;
}

bool Validator::checkSignature(BaseReader& reader, const std::string& filePath, const Signature& signature) {
    auto expected = hex_to_bytes(signature.magicHex);
    if (!expected) {
        std::string msg = "Invalid magic bytes format: '" + signature.magicHex + "' (must be hex string)";
        logger.error(msg);
        throw InvalidSignature(msg);
    }

    std::vector<uint8_t> actual = reader.readBytes(filePath, expected->size(), signature.offset);
    if (actual == *expected) {
        logger.debug("Magic bytes match at offset 0x" + to_hex(signature.offset) + ": " + signature.magicHex);
        return true;
    }

    logger.debug("Magic bytes mismatch at offset 0x" + to_hex(signature.offset) +
                 ". Expected: " + signature.magicHex + ", Got: " + bytes_to_hex(actual));
    return false;
}

bool Validator::validate(const std::string& filePath) {
    ValidationOutcome outcome = inspect(filePath);
    switch (outcome.status) {
        case OutcomeStatus::Valid:
            return true;
        case OutcomeStatus::Invalid:
            throw ValidationError(outcome.message);
        case OutcomeStatus::Fault:
            break;
    }

    switch (outcome.fault) {
        case FaultKind::SignatureNotFound: throw SignatureNotFound(outcome.message);
        case FaultKind::InvalidSignature:  throw InvalidSignature(outcome.message);
        case FaultKind::Store:             throw StoreError(outcome.message);
        case FaultKind::FileRead:
        case FaultKind::None:
            break;
    }
    throw FileReadError(outcome.message);
}

std::string Validator::computeDigest(const std::string& filePath) {
    logger.debug("Calculating SHA-256 hash for: " + filePath);
    try {
        std::string digest = sha256File(filePath);
        logger.debug("SHA-256 hash: " + digest);
        return digest;
    } catch (const FileReadError& e) {
        logger.error(e.what());
        throw;
    }
}

void Validator::close() {
    logger.debug("Closing validator and signature store");
    store.close();
}
