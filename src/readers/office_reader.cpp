#include "office_reader.hpp"
#include "zip_container.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils/helpers.hpp"

const std::map<std::string, std::vector<std::string>>& OfficeReader::requiredEntries() {
    static const std::map<std::string, std::vector<std::string>> entries = {
        {"docx", {"[Content_Types].xml", "word/document.xml"}},
        {"xlsx", {"[Content_Types].xml", "xl/workbook.xml"}},
        {"pptx", {"[Content_Types].xml", "ppt/presentation.xml"}},
    };
    return entries;
}

bool OfficeReader::supports(const std::string& extension) const {
    return requiredEntries().count(normalize_extension(extension)) > 0;
}

bool OfficeReader::validateStructure(const std::string& filePath, const std::string& extension) {
    std::string ext = normalize_extension(extension);
    auto it = requiredEntries().find(ext);
    if (it == requiredEntries().end()) {
        logger.warn("Extension '." + ext + "' is not an office document type");
        return false;
    }

    logger.debug("Validating ZIP structure for '." + ext + "' file");
    if (!isZipContainer(filePath)) {
        logger.warn("File '" + filePath + "' is not a valid ZIP archive");
        return false;
    }

    std::string zipError;
    auto archive = ZipArchive::open(filePath, true, zipError);
    if (!archive) {
        std::string msg = "Corrupted ZIP file '" + filePath + "': " + zipError;
        logger.error(msg);
        throw FileReadError(msg);
    }

    for (const auto& required : it->second) {
        if (!archive->contains(required)) {
            logger.warn("Missing required entry '" + required + "' in '." + ext + "' document");
            return false;
        }
    }

    logger.debug("All required entries present for '." + ext + "' document");
    return true;
}
