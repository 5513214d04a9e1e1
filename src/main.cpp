#include <iostream>
#include <string>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <curl/curl.h>

#include "app/Pipeline.hpp"
#include "config/Configuration.hpp"
#include "clipboard/ClipboardWriter.hpp"

namespace {

bool debugRequested() {
    const char* value = std::getenv("UPPY_DEBUG");
    return value != nullptr && *value != '\0' && std::string(value) != "0";
}

}

int main(int argc, char** argv)
{
    // A clipboard helper that exits early must not kill us on write
    std::signal(SIGPIPE, SIG_IGN);

    uppy::PipelineOptions options;
    try {
        options.configDir = uppy::ConfigStore::configDirectoryFromEnvironment();
    } catch (const uppy::ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // First run writes the template even without a file argument
    if (argc < 2) {
        uppy::Pipeline bootstrapOnly(options, std::cin, std::cout, std::cerr);
        if (auto status = bootstrapOnly.bootstrapConfig()) {
            return *status;
        }
        std::cerr << "Usage: " << (argc > 0 ? argv[0] : "uppy") << " <file>" << std::endl;
        return 1;
    }

    std::error_code ec;
    std::filesystem::path executedPath = std::filesystem::current_path(ec);
    if (ec) {
        std::cerr << "Failed to get executed directory!\n" << ec.message() << std::endl;
        return 1;
    }
    options.targetFile = executedPath / argv[1];

    options.tempDir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        std::cerr << "Failed to locate the temp directory: " << ec.message() << std::endl;
        return 1;
    }
    options.clipboardCommand = uppy::ClipboardWriter::detectCommand();
    options.verbose = debugRequested();

    CURLcode init = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (init != CURLE_OK) {
        std::cerr << "Failed to initialize CURL: " << curl_easy_strerror(init) << std::endl;
        return 1;
    }
    uppy::Pipeline pipeline(options, std::cin, std::cout, std::cerr);
    int status = pipeline.run();
    curl_global_cleanup();
    return status;
}
