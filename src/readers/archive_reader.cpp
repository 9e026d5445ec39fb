#include "archive_reader.hpp"
#include "zip_container.hpp"
#include "logger.hpp"
#include "utils/helpers.hpp"

bool ArchiveReader::supports(const std::string& extension) const {
    return normalize_extension(extension) == "zip";
}

bool ArchiveReader::validateStructure(const std::string& filePath, const std::string& extension) {
    logger.debug("Validating plain ZIP file for '." + normalize_extension(extension) + "'");

    if (!isZipContainer(filePath)) {
        logger.warn("File '" + filePath + "' is not a valid ZIP");
        return false;
    }

    std::string zipError;
    auto archive = ZipArchive::open(filePath, true, zipError);
    if (!archive) {
        logger.warn("File '" + filePath + "' is not a valid ZIP: " + zipError);
        return false;
    }

    logger.debug("ZIP contains " + std::to_string(archive->entryNames().size()) + " entries");
    return true;
}
