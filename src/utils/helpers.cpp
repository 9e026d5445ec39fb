#include "helpers.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <filesystem>

//
// Little-endian readers
//
uint16_t read_le16(const std::vector<uint8_t>& blob, size_t offset) {
    return static_cast<uint16_t>((blob[offset + 1] << 8) |
                                 (blob[offset]));
}

uint32_t read_le32(const std::vector<uint8_t>& blob, size_t offset) {
    return (static_cast<uint32_t>(blob[offset + 3]) << 24) |
           (static_cast<uint32_t>(blob[offset + 2]) << 16) |
           (static_cast<uint32_t>(blob[offset + 1]) << 8) |
           (static_cast<uint32_t>(blob[offset]));
}

std::string to_hex(uint64_t value)
{
   std::array<char, 32> buffer;
   auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(),
                              value, 16);  // base 16

   return std::string(buffer.data(), result.ptr);
}

std::string bytes_to_hex(const std::vector<uint8_t>& bytes) {
    static const char digits[] = "0123456789ABCDEF";
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        hex += digits[(b >> 4) & 0x0F];
        hex += digits[b & 0x0F];
    }
    return hex;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<std::vector<uint8_t>> hex_to_bytes(const std::string& hex) {
    if (hex.empty() || hex.size() % 2 != 0)
        return std::nullopt;

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0)
            return std::nullopt;
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

bool is_hex(const std::string& hex) {
    return hex_to_bytes(hex).has_value();
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string normalize_extension(const std::string& extension) {
    std::string ext = to_lower(extension);
    size_t first = ext.find_first_not_of('.');
    return first == std::string::npos ? std::string() : ext.substr(first);
}

// Uppercase with whitespace and the usual byte separators removed.
std::string normalize_hex(const std::string& hex) {
    std::string out;
    out.reserve(hex.size());
    for (unsigned char c : hex) {
        if (std::isspace(c) || c == ':' || c == '-')
            continue;
        out += static_cast<char>(std::toupper(c));
    }
    return out;
}

std::string extension_of(const std::string& path) {
    return normalize_extension(std::filesystem::path(path).extension().string());
}
