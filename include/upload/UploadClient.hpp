#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "config/Configuration.hpp"
#include "upload/UploadOutcome.hpp"

namespace uppy {

class UploadClient {
public:
    UploadClient(const std::string& host, const std::string& token);
    explicit UploadClient(const Configuration& config);

    // POST the file as multipart field "file" to {host}/api/upload. Never throws.
    UploadOutcome upload(const std::filesystem::path& filePath) const;

    // Authorization (token verbatim), Format: RANDOM, Embed: true
    std::vector<std::string> constructHeaders() const;

    std::string getUploadUrl() const;

    // Print DEBUG traces to stderr
    void setVerbose(bool verbose) { verbose_ = verbose; }

private:
    std::string host_;
    std::string token_;
    bool verbose_ = false;

    // Whole file into memory; nullopt and a reason on failure
    static std::optional<std::string> readFileBytes(const std::filesystem::path& filePath, std::string& error);

    // Maps a completed response status onto an outcome
    static UploadOutcome classify(long httpCode, std::string body);
};

} // namespace uppy
