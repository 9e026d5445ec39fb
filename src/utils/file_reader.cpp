#include "file_reader.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>

static std::string openFailure(const std::string& path) {
    int err = errno;
    std::string reason = err != 0 ? std::strerror(err) : "cannot open file";
    return "Failed to read file '" + path + "': " + reason;
}

std::vector<uint8_t> readBytesAt(const std::string& path, size_t length, uint64_t offset) {
    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file)
        throw FileReadError(openFailure(path));

    file.seekg(0, std::ios::end);
    std::streamoff size = file.tellg();
    if (size < 0)
        throw FileReadError("Failed to read file '" + path + "': cannot determine size");

    std::vector<uint8_t> data;
    if (offset >= static_cast<uint64_t>(size) || length == 0)
        return data;

    uint64_t available = static_cast<uint64_t>(size) - offset;
    data.resize(static_cast<size_t>(std::min<uint64_t>(length, available)));

    file.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (file.bad())
        throw FileReadError("Failed to read file '" + path + "': I/O error");

    data.resize(static_cast<size_t>(file.gcount()));
    return data;
}

std::vector<uint8_t> readTail(const std::string& path, size_t maxLength) {
    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file)
        throw FileReadError(openFailure(path));

    file.seekg(0, std::ios::end);
    std::streamoff size = file.tellg();
    if (size < 0)
        throw FileReadError("Failed to read file '" + path + "': cannot determine size");

    uint64_t start = static_cast<uint64_t>(size) > maxLength ? static_cast<uint64_t>(size) - maxLength : 0;
    return readBytesAt(path, maxLength, start);
}
