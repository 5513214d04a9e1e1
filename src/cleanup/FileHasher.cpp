#include "cleanup/FileHasher.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <cstring>
#include <cerrno>

namespace uppy {

namespace {
    using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    DigestContext beginMd5() {
        DigestContext ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
        if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
            throw std::runtime_error("Failed to initialize MD5 digest");
        }
        return ctx;
    }

    void update(EVP_MD_CTX* ctx, const char* data, size_t len) {
        if (EVP_DigestUpdate(ctx, data, len) != 1) {
            throw std::runtime_error("Failed to update MD5 digest");
        }
    }

    std::string finishHex(EVP_MD_CTX* ctx) {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digestLen = 0;
        if (EVP_DigestFinal_ex(ctx, digest, &digestLen) != 1) {
            throw std::runtime_error("Failed to finalize MD5 digest");
        }

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (unsigned int i = 0; i < digestLen; ++i) {
            ss << std::setw(2) << static_cast<int>(digest[i]);
        }
        return ss.str();
    }
}

std::string FileHasher::md5Hex(const std::filesystem::path& filePath, size_t chunkSize) {
    if (chunkSize == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }

    std::ifstream inFile(filePath, std::ios::binary);
    if (!inFile) {
        throw std::runtime_error("Error reading file " + filePath.string() + " (" + std::strerror(errno) + ")");
    }

    auto ctx = beginMd5();
    std::vector<char> buffer(chunkSize);
    while (inFile) {
        inFile.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = inFile.gcount();
        if (got > 0) {
            update(ctx.get(), buffer.data(), static_cast<size_t>(got));
        }
    }
    if (inFile.bad()) {
        throw std::runtime_error("Error reading file " + filePath.string());
    }

    return finishHex(ctx.get());
}

std::string FileHasher::md5Hex(const std::string& data) {
    auto ctx = beginMd5();
    update(ctx.get(), data.data(), data.size());
    return finishHex(ctx.get());
}

} // namespace uppy
