#pragma once

#include <string>
#include <filesystem>

namespace uppy {

// Soft delete: files are renamed into basePath as {md5}.tmp instead of being erased
class FileStash {
public:
    explicit FileStash(const std::filesystem::path& basePath);

    // Where the file would land, derived from its current content
    std::filesystem::path pathFor(const std::filesystem::path& filePath) const;

    // Renames the file into the stash and returns the new path.
    // Throws std::runtime_error with the OS reason; the original stays in place on failure.
    std::filesystem::path stash(const std::filesystem::path& filePath) const;

    // Reads back a stashed file
    std::string readFile(const std::filesystem::path& stashedPath) const;

    const std::filesystem::path& getBasePath() const { return basePath_; }

private:
    std::filesystem::path basePath_;
};

} // namespace uppy
