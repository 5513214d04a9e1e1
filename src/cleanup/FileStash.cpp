#include "cleanup/FileStash.hpp"
#include "cleanup/FileHasher.hpp"
#include "const/defaults.hpp"
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace uppy {

FileStash::FileStash(const std::filesystem::path& basePath)
    : basePath_(basePath) {}

std::filesystem::path FileStash::pathFor(const std::filesystem::path& filePath) const {
    return basePath_ / (FileHasher::md5Hex(filePath) + STASH_SUFFIX);
}

std::filesystem::path FileStash::stash(const std::filesystem::path& filePath) const {
    std::filesystem::path destination = pathFor(filePath);

    std::error_code ec;
    std::filesystem::rename(filePath, destination, ec);
    if (ec) {
        throw std::runtime_error(ec.message());
    }
    return destination;
}

std::string FileStash::readFile(const std::filesystem::path& stashedPath) const {
    std::ifstream inFile(stashedPath, std::ios::binary);
    if (!inFile) {
        throw std::runtime_error("File not found: " + stashedPath.string());
    }

    std::string content((std::istreambuf_iterator<char>(inFile)),
                        std::istreambuf_iterator<char>());
    return content;
}

} // namespace uppy
