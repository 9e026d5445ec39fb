#include "signature_loader.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "helpers.hpp"
#include "store/signature_store.hpp"
#include "cJSON.h"
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>

namespace fs = std::filesystem;

namespace {

struct JsonDeleter {
    void operator()(cJSON* json) const { cJSON_Delete(json); }
};
using JsonPtr = std::unique_ptr<cJSON, JsonDeleter>;

std::string readText(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file)
        throw FileReadError("Signature file not found: " + path);
    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
}

JsonPtr parseDocument(const std::string& path) {
    std::string text = readText(path);
    return JsonPtr(cJSON_Parse(text.c_str()));
}

std::optional<std::string> optionalString(const cJSON* entry, const char* key) {
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(entry, key);
    if (cJSON_IsString(item) && item->valuestring)
        return std::string(item->valuestring);
    return std::nullopt;
}

// Absent offset means 0. Anything present must be a whole number in [0, INT64_MAX].
int64_t entryOffset(const cJSON* entry) {
    const cJSON* off = cJSON_GetObjectItemCaseSensitive(entry, "offset");
    if (!off)
        return 0;
    if (!cJSON_IsNumber(off))
        throw InvalidInput("offset must be a number");

    double value = off->valuedouble;
    if (!std::isfinite(value) || value != std::floor(value))
        throw InvalidInput("offset must be an integer");
    if (value < 0 || value >= 9223372036854775808.0)
        throw InvalidInput("offset out of range");
    return static_cast<int64_t>(value);
}

// Empty string when valid, otherwise the reason.
std::string checkStructure(const cJSON* root) {
    if (!cJSON_IsObject(root))
        return "JSON root must be an object";

    const cJSON* signatures = cJSON_GetObjectItemCaseSensitive(root, "signatures");
    if (!signatures)
        return "JSON must have 'signatures' array";
    if (!cJSON_IsArray(signatures))
        return "'signatures' must be an array";

    int i = 0;
    const cJSON* entry = nullptr;
    cJSON_ArrayForEach(entry, signatures) {
        std::string where = "Signature " + std::to_string(i++);
        if (!cJSON_IsObject(entry))
            return where + " must be an object";

        const cJSON* ext = cJSON_GetObjectItemCaseSensitive(entry, "extension");
        const cJSON* magic = cJSON_GetObjectItemCaseSensitive(entry, "magic_bytes");
        if (!cJSON_IsString(ext))
            return where + " missing required field: extension";
        if (!cJSON_IsString(magic))
            return where + " missing required field: magic_bytes";
        if (!is_hex(normalize_hex(magic->valuestring)))
            return where + " has invalid magic_bytes (must be hex): " + magic->valuestring;
    }
    return "";
}

}

bool SignatureLoader::validateSource(const std::string& sourcePath) {
    try {
        JsonPtr root = parseDocument(sourcePath);
        if (!root) {
            logger.error("Invalid JSON in " + sourcePath);
            return false;
        }
        std::string problem = checkStructure(root.get());
        if (!problem.empty()) {
            logger.error(problem);
            return false;
        }
        return true;
    } catch (const FileReadError& e) {
        logger.error(e.what());
        return false;
    }
}

LoadReport SignatureLoader::load(const std::string& sourcePath, SignatureStore& store) {
    logger.info("Loading signatures from: " + sourcePath);

    JsonPtr root = parseDocument(sourcePath);
    if (!root)
        throw InvalidInput("Invalid JSON in " + sourcePath);

    std::string problem = checkStructure(root.get());
    if (!problem.empty()) {
        logger.error(problem);
        throw InvalidInput("Invalid JSON structure in " + sourcePath + ": " + problem);
    }

    LoadReport report;
    const cJSON* entry = nullptr;
    cJSON_ArrayForEach(entry, cJSON_GetObjectItemCaseSensitive(root.get(), "signatures")) {
        std::string extension = cJSON_GetObjectItemCaseSensitive(entry, "extension")->valuestring;
        std::string magic = cJSON_GetObjectItemCaseSensitive(entry, "magic_bytes")->valuestring;

        try {
            store.addSignature(extension, magic, entryOffset(entry),
                               optionalString(entry, "description"),
                               optionalString(entry, "mime_type"));
            report.loaded++;
        } catch (const DuplicateSignature& e) {
            logger.debug("Skipped signature for '." + extension + "': " + e.what());
            report.skipped++;
        } catch (const InvalidInput& e) {
            logger.debug("Skipped signature for '." + extension + "': " + e.what());
            report.skipped++;
        }
    }

    logger.info("Loaded " + std::to_string(report.loaded) + " signatures, skipped " +
                std::to_string(report.skipped));
    return report;
}

size_t SignatureLoader::exportTo(SignatureStore& store, const std::string& outputPath) {
    logger.info("Exporting signatures to: " + outputPath);

    JsonPtr root(cJSON_CreateObject());
    cJSON_AddStringToObject(root.get(), "version", "1.0");
    cJSON_AddStringToObject(root.get(), "description", "Exported signatures from HexGuard");
    cJSON* signatures = cJSON_AddArrayToObject(root.get(), "signatures");

    size_t count = 0;
    for (const auto& ext : store.allExtensions()) {
        for (const auto& r : store.getRecords(ext)) {
            cJSON* item = cJSON_CreateObject();
            cJSON_AddStringToObject(item, "extension", r.extension.c_str());
            cJSON_AddStringToObject(item, "magic_bytes", r.magicHex.c_str());
            cJSON_AddNumberToObject(item, "offset", static_cast<double>(r.offset));
            if (r.description)
                cJSON_AddStringToObject(item, "description", r.description->c_str());
            if (r.mimeType)
                cJSON_AddStringToObject(item, "mime_type", r.mimeType->c_str());
            cJSON_AddItemToArray(signatures, item);
            count++;
        }
    }

    fs::path output(outputPath);
    std::error_code ec;
    if (output.has_parent_path())
        fs::create_directories(output.parent_path(), ec);

    std::ofstream outFile(output, std::ios::binary);
    if (!outFile.is_open())
        throw FileReadError("Cannot open output file: " + outputPath);

    char* jsonStr = cJSON_Print(root.get());
    if (!jsonStr)
        throw FileReadError("Failed to serialise signatures for " + outputPath);
    outFile.write(jsonStr, static_cast<std::streamsize>(std::strlen(jsonStr)));
    outFile << "\n";
    free(jsonStr);
    if (!outFile)
        throw FileReadError("Failed to write " + outputPath);

    logger.info("Exported " + std::to_string(count) + " signatures to " + outputPath);
    return count;
}

size_t initializeDefaultSignatures(SignatureStore& store,
                                   const std::vector<fs::path>& candidates,
                                   Logger& logger) {
    size_t existing = store.count();
    if (existing > 0) {
        logger.debug("Signature store already contains " + std::to_string(existing) + " signatures");
        return 0;
    }

    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            logger.info("Found signature file at: " + candidate.string());
            SignatureLoader loader(logger);
            return loader.load(candidate.string(), store).loaded;
        }
    }

    logger.warn("No signature file found. Signature store will be empty.");
    return 0;
}
