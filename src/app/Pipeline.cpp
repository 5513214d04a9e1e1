#include "app/Pipeline.hpp"
#include "config/Configuration.hpp"
#include "upload/UploadClient.hpp"
#include "upload/ResponseParser.hpp"
#include "clipboard/ClipboardWriter.hpp"
#include "cleanup/CleanupPrompter.hpp"
#include "cleanup/FileStash.hpp"

namespace uppy {

Pipeline::Pipeline(const PipelineOptions& options, std::istream& in, std::ostream& out, std::ostream& err)
    : options_(options), in_(in), out_(out), err_(err) {}

std::optional<int> Pipeline::bootstrapConfig() {
    try {
        ConfigStore store(options_.configDir);
        if (store.bootstrap()) {
            out_ << "Configuration directory created in " << store.getConfigDir().string()
                 << ", fill out " << store.getConfigFile().filename().string() << " and run again" << std::endl;
            return 0;
        }
    } catch (const ConfigError& e) {
        err_ << "Error creating configuration: " << e.what() << std::endl;
        return 1;
    }
    return std::nullopt;
}

int Pipeline::run() {
    if (auto status = bootstrapConfig()) {
        return *status;
    }

    Configuration config;
    try {
        config = ConfigStore(options_.configDir).load();
    } catch (const ConfigError& e) {
        err_ << "Error reading configuration file: " << e.what() << std::endl;
        return 1;
    }

    UploadClient client(config);
    client.setVerbose(options_.verbose);

    UploadOutcome outcome = client.upload(options_.targetFile);
    auto* success = std::get_if<UploadSuccess>(&outcome);
    if (!success) {
        out_ << describe(outcome) << std::endl;
        return 0;
    }

    ParsedResponse parsed;
    try {
        parsed = ResponseParser::parse(success->body);
    } catch (const ResponseFormatError& e) {
        err_ << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Zero or several URLs: nothing to copy, nothing to clean up
    auto url = ResponseParser::takeSingleUrl(parsed);
    if (!url) {
        return 0;
    }

    out_ << "Uploaded URL: " << *url << std::endl;

    ClipboardWriter clipboard(options_.clipboardCommand);
    std::string clipboardError;
    if (!clipboard.copyText(*url, clipboardError)) {
        err_ << "Something went wrong while copying URL to clipboard: " << clipboardError << std::endl;
        return 0;
    }
    out_ << "Copied URL to clipboard!" << std::endl;

    FileStash stash(options_.tempDir);
    CleanupPrompter prompter(in_, out_, err_, stash);
    prompter.run(options_.targetFile);
    return 0;
}

} // namespace uppy
