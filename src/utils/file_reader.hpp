#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Reads up to length bytes starting at offset. Returns fewer bytes at EOF.
// Throws FileReadError if the file cannot be opened or read.
std::vector<uint8_t> readBytesAt(const std::string& path, size_t length, uint64_t offset);

// Last maxLength bytes of the file (the whole file if it is shorter).
std::vector<uint8_t> readTail(const std::string& path, size_t maxLength);
