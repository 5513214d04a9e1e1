#pragma once

#include <string>
#include <vector>
#include <optional>
#include <stdexcept>

namespace uppy {

// Body of a successful upload: {"files": ["<url>", ...]}
struct ParsedResponse {
    std::vector<std::string> files;
};

class ResponseFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ResponseParser {
public:
    // Throws ResponseFormatError when the body is not JSON or lacks a string array "files"
    static ParsedResponse parse(const std::string& body);

    // Removes and returns the URL when exactly one was returned; nullopt for zero or several
    static std::optional<std::string> takeSingleUrl(ParsedResponse& response);
};

} // namespace uppy
