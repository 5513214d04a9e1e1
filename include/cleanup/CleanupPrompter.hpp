#pragma once

#include <iostream>
#include <filesystem>
#include "const/cleanup_enums.hpp"
#include "cleanup/FileStash.hpp"

namespace uppy {

/**
 * Asks once whether the uploaded file should be removed and, on "yes",
 * moves it into the stash. An invalid answer is reported and never re-asked.
 */
class CleanupPrompter {
public:
    CleanupPrompter(std::istream& in, std::ostream& out, std::ostream& err, const FileStash& stash);

    // Prints the question and reads one line; end of input counts as INVALID
    DeletionChoice askForChoice();

    // Full prompt + action. Returns true only when the file was moved into the stash.
    bool run(const std::filesystem::path& targetFile);

private:
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
    const FileStash& stash_;
};

} // namespace uppy
