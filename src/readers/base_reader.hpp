#pragma once
#include <cstdint>
#include <string>
#include <vector>

class Logger;

class BaseReader {
public:
    explicit BaseReader(Logger& logger) : logger(logger) {}
    virtual ~BaseReader() = default;

    virtual std::string name() const = 0;
    virtual bool supports(const std::string& extension) const = 0;

    // Up to length bytes at offset; short at EOF, never padded.
    // Throws FileReadError on I/O failure.
    virtual std::vector<std::uint8_t> readBytes(const std::string& filePath, size_t length, uint64_t offset);

    // Format-specific nested check run after a magic-byte match.
    virtual bool validateStructure(const std::string& filePath, const std::string& extension) = 0;

protected:
    Logger& logger;
};
