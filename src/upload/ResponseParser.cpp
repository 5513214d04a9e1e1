#include "upload/ResponseParser.hpp"
#include <nlohmann/json.hpp>

namespace uppy {

ParsedResponse ResponseParser::parse(const std::string& body) {
    ParsedResponse parsed;
    try {
        nlohmann::json jsonResponse = nlohmann::json::parse(body);
        jsonResponse.at("files").get_to(parsed.files);
    } catch (const nlohmann::json::exception& e) {
        throw ResponseFormatError(std::string("Failed to deserialise JSON response: ") + e.what());
    }
    return parsed;
}

std::optional<std::string> ResponseParser::takeSingleUrl(ParsedResponse& response) {
    if (response.files.size() != 1) {
        return std::nullopt;
    }
    std::string url = std::move(response.files.back());
    response.files.pop_back();
    return url;
}

} // namespace uppy
