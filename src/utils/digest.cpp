#include "digest.hpp"
#include "errors.hpp"
#include "helpers.hpp"
#include <openssl/evp.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

namespace {
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
}

std::string sha256File(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        throw FileReadError("Failed to hash file '" + path + "': not a regular file");

    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::string reason = errno != 0 ? std::strerror(errno) : "cannot open file";
        throw FileReadError("Failed to hash file '" + path + "': " + reason);
    }

    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        throw FileReadError("Failed to hash file '" + path + "': digest initialisation failed");

    std::vector<char> buffer(DIGEST_CHUNK_SIZE);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = file.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1)
            throw FileReadError("Failed to hash file '" + path + "': digest update failed");
    }
    if (file.bad())
        throw FileReadError("Failed to hash file '" + path + "': I/O error");

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hashLen) != 1)
        throw FileReadError("Failed to hash file '" + path + "': digest finalisation failed");

    static constexpr char hexChars[] = "0123456789abcdef";
    std::string result;
    result.reserve(hashLen * 2);
    for (unsigned int i = 0; i < hashLen; i++) {
        result += hexChars[(hash[i] >> 4) & 0x0F];
        result += hexChars[hash[i] & 0x0F];
    }
    return result;
}
