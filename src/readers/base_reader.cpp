#include "base_reader.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils/file_reader.hpp"
#include "utils/helpers.hpp"

std::vector<std::uint8_t> BaseReader::readBytes(const std::string& filePath, size_t length, uint64_t offset) {
    logger.debug("Reading " + std::to_string(length) + " bytes from '" + filePath +
                 "' at offset 0x" + to_hex(offset));
    try {
        std::vector<std::uint8_t> bytes = readBytesAt(filePath, length, offset);
        logger.debug("Read signature: " + bytes_to_hex(bytes));
        return bytes;
    } catch (const FileReadError& e) {
        logger.error(e.what());
        throw;
    }
}
