#pragma once
#include <cstdint>
#include <vector>
#include <string>
#include <optional>

#define DEFAULT_MAX_FILE_SIZE (100ULL * 1024 * 1024)
#define DIGEST_CHUNK_SIZE 8192

//
// Little-endian readers
//
uint16_t read_le16(const std::vector<uint8_t>& blob, size_t offset);
uint32_t read_le32(const std::vector<uint8_t>& blob, size_t offset);

//
// Hex conversion
//
std::string to_hex(uint64_t value);
std::string bytes_to_hex(const std::vector<uint8_t>& bytes);
// std::nullopt when the text is empty, has an odd digit count or a non-hex digit.
std::optional<std::vector<uint8_t>> hex_to_bytes(const std::string& hex);
bool is_hex(const std::string& hex);

//
// Signature normalisation
//
std::string to_lower(std::string text);
std::string normalize_extension(const std::string& extension);
std::string normalize_hex(const std::string& hex);
std::string extension_of(const std::string& path);
