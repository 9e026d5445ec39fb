#include "flat_reader.hpp"
#include "logger.hpp"
#include "utils/helpers.hpp"

const std::set<std::string>& FlatReader::knownExtensions() {
    static const std::set<std::string> extensions = {
        // images
        "png", "jpg", "jpeg", "gif", "bmp", "ico", "webp",
        // audio / video
        "mp3", "mp4", "avi", "mkv", "wav", "flac",
        // documents
        "pdf", "xml", "html", "json",
        // archives
        "tar", "gz", "rar", "7z",
        // binaries
        "exe", "dll", "elf", "sqlite", "db"
    };
    return extensions;
}

bool FlatReader::supports(const std::string& extension) const {
    return knownExtensions().count(normalize_extension(extension)) > 0;
}

bool FlatReader::validateStructure(const std::string& filePath, const std::string& extension) {
    logger.debug("'." + normalize_extension(extension) + "' (" + filePath +
                 ") needs no structure validation");
    return true;
}
