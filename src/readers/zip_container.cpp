#include "zip_container.hpp"
#include "utils/file_reader.hpp"
#include "utils/helpers.hpp"
#include <zip.h>

static const size_t EOCD_SIZE = 22;
static const size_t MAX_COMMENT = 0xFFFF;
static const size_t CD_ENTRY_MIN_SIZE = 46;

// Backward search for EOCD: 50 4B 05 06.
// The last candidate whose comment length fits the buffer and whose central
// directory is large enough for its declared entry count wins.
bool hasEndOfCentralDirectory(const std::vector<uint8_t>& tail) {
    if (tail.size() < EOCD_SIZE)
        return false;

    for (size_t i = tail.size() - EOCD_SIZE + 1; i-- > 0;) {
        if (tail[i + 0] != 0x50 ||
            tail[i + 1] != 0x4B ||
            tail[i + 2] != 0x05 ||
            tail[i + 3] != 0x06)
            continue;

        // Comment length at offset +20 (2 bytes, LE)
        uint16_t commentLen = read_le16(tail, i + 20);
        if (i + EOCD_SIZE + commentLen > tail.size())
            continue;

        // total entries (+10) and size of central directory (+12)
        uint16_t entries = read_le16(tail, i + 10);
        uint32_t sizeCD = read_le32(tail, i + 12);
        if (static_cast<uint64_t>(sizeCD) < static_cast<uint64_t>(CD_ENTRY_MIN_SIZE) * entries)
            continue;

        return true;
    }
    return false;
}

bool isZipContainer(const std::string& path) {
    return hasEndOfCentralDirectory(readTail(path, EOCD_SIZE + MAX_COMMENT));
}

std::unique_ptr<ZipArchive> ZipArchive::open(const std::string& path, bool checkConsistency, std::string& error) {
    int flags = ZIP_RDONLY;
    if (checkConsistency)
        flags |= ZIP_CHECKCONS;

    int errorCode = 0;
    zip_t* archive = zip_open(path.c_str(), flags, &errorCode);
    if (!archive) {
        zip_error_t zerr;
        zip_error_init_with_code(&zerr, errorCode);
        error = zip_error_strerror(&zerr);
        zip_error_fini(&zerr);
        return nullptr;
    }
    return std::unique_ptr<ZipArchive>(new ZipArchive(archive));
}

ZipArchive::~ZipArchive() {
    zip_discard(archive);
}

bool ZipArchive::contains(const std::string& entryName) const {
    return zip_name_locate(archive, entryName.c_str(), 0) >= 0;
}

std::vector<std::string> ZipArchive::entryNames() const {
    std::vector<std::string> names;
    zip_int64_t numEntries = zip_get_num_entries(archive, 0);
    for (zip_uint64_t i = 0; i < static_cast<zip_uint64_t>(numEntries); ++i) {
        const char* name = zip_get_name(archive, i, 0);
        if (name)
            names.emplace_back(name);
    }
    return names;
}
