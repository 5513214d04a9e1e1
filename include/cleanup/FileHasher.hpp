#pragma once

#include <string>
#include <filesystem>
#include "const/defaults.hpp"

namespace uppy {

class FileHasher {
public:
    // Lowercase hex MD5 of the file, read chunkSize bytes at a time
    static std::string md5Hex(const std::filesystem::path& filePath, size_t chunkSize = HASH_CHUNK_SIZE);

    // Lowercase hex MD5 of an in-memory buffer
    static std::string md5Hex(const std::string& data);
};

} // namespace uppy
