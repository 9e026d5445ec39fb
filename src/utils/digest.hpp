#pragma once
#include <string>

// Lowercase hex SHA-256 of the whole file, streamed in DIGEST_CHUNK_SIZE
// blocks. Throws FileReadError on any I/O failure.
std::string sha256File(const std::string& path);
