#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct zip;

// True when the buffer holds a ZIP end-of-central-directory record whose
// trailing comment fits in the buffer.
bool hasEndOfCentralDirectory(const std::vector<uint8_t>& tail);

// Cheap "is this a ZIP at all" check on the last 64 KiB of the file.
// Throws FileReadError if the file cannot be read.
bool isZipContainer(const std::string& path);

// Read-only libzip handle; changes are never written back.
class ZipArchive {
public:
    // nullptr with a libzip message in error when the archive does not open.
    static std::unique_ptr<ZipArchive> open(const std::string& path, bool checkConsistency, std::string& error);
    ~ZipArchive();

    ZipArchive(const ZipArchive&) = delete;
    ZipArchive& operator=(const ZipArchive&) = delete;

    bool contains(const std::string& entryName) const;
    std::vector<std::string> entryNames() const;

private:
    explicit ZipArchive(struct zip* archive) : archive(archive) {}
    struct zip* archive;
};
