#pragma once

#include <iostream>
#include <string>
#include <optional>
#include <filesystem>

namespace uppy {

// Everything the pipeline would otherwise pull from the process environment
struct PipelineOptions {
    std::filesystem::path configDir;    // holds config.json
    std::filesystem::path targetFile;   // absolute path of the file to upload
    std::filesystem::path tempDir;      // soft-delete destination
    std::string clipboardCommand;       // empty when no helper is available
    bool verbose = false;
};

/**
 * config -> upload -> parse -> clipboard -> cleanup prompt.
 * Each stage blocks; a failing stage ends the run.
 */
class Pipeline {
public:
    Pipeline(const PipelineOptions& options, std::istream& in, std::ostream& out, std::ostream& err);

    // 0 for a normal end (including reported upload failures), 1 for fatal errors
    int run();

    // Writes the config template on first run. Returns an exit status when the run stops here.
    std::optional<int> bootstrapConfig();

private:
    PipelineOptions options_;
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace uppy
