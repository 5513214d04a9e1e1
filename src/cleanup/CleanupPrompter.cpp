#include "cleanup/CleanupPrompter.hpp"
#include <string>
#include <stdexcept>

namespace uppy {

CleanupPrompter::CleanupPrompter(std::istream& in, std::ostream& out, std::ostream& err, const FileStash& stash)
    : in_(in), out_(out), err_(err), stash_(stash) {}

DeletionChoice CleanupPrompter::askForChoice() {
    out_ << "Would you like to delete the file? (Y/N)" << std::endl;

    std::string answer;
    if (!std::getline(in_, answer)) {
        return DeletionChoice::INVALID;
    }
    return from_string(answer);
}

bool CleanupPrompter::run(const std::filesystem::path& targetFile) {
    switch (askForChoice()) {
        case DeletionChoice::YES:
            try {
                stash_.stash(targetFile);
                out_ << "File deleted!" << std::endl;
                return true;
            } catch (const std::exception& e) {
                out_ << "Something went wrong while moving the file to the temp dir: " << e.what() << std::endl;
                return false;
            }
        case DeletionChoice::NO:
            return false;
        case DeletionChoice::INVALID:
        default:
            err_ << "Invalid choice" << std::endl;
            return false;
    }
}

} // namespace uppy
