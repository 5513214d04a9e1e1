#include "MultipartDecoder.hpp"
#include <cctype>

namespace uppy {
namespace test {

std::string MultipartDecoder::trimmed(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

std::string MultipartDecoder::lowered(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string MultipartDecoder::unquoted(const std::string& s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

void MultipartDecoder::readDisposition(const std::string& value, FormPart& part) {
    size_t pos = 0;
    while (pos <= value.size()) {
        size_t semi = value.find(';', pos);
        if (semi == std::string::npos) semi = value.size();
        std::string param = trimmed(value.substr(pos, semi - pos));
        pos = semi + 1;

        auto eq = param.find('=');
        if (eq == std::string::npos) continue;

        std::string key = lowered(trimmed(param.substr(0, eq)));
        std::string val = unquoted(trimmed(param.substr(eq + 1)));
        if (key == "name") part.name = val;
        else if (key == "filename") part.filename = val;
    }
}

std::string MultipartDecoder::boundaryOf(const std::string& contentType) {
    std::string lower = lowered(contentType);
    size_t at = lower.find("boundary=");
    if (at == std::string::npos) return "";

    std::string rest = contentType.substr(at + 9);
    size_t end = rest.find(';');
    return unquoted(trimmed(rest.substr(0, end)));
}

std::vector<FormPart> MultipartDecoder::decode(const std::string& body, const std::string& boundary) {
    std::vector<FormPart> parts;
    if (boundary.empty()) return parts;

    const std::string delimiter = "--" + boundary;
    size_t cursor = body.find(delimiter);

    while (cursor != std::string::npos) {
        cursor += delimiter.size();
        if (body.compare(cursor, 2, "--") == 0) break;      // closing delimiter
        if (body.compare(cursor, 2, "\r\n") != 0) break;
        cursor += 2;

        size_t headersEnd = body.find("\r\n\r\n", cursor);
        if (headersEnd == std::string::npos) break;

        FormPart part;
        size_t line = cursor;
        while (line < headersEnd) {
            size_t eol = body.find("\r\n", line);
            if (eol == std::string::npos || eol > headersEnd) eol = headersEnd;
            std::string header = body.substr(line, eol - line);
            line = eol + 2;

            auto colon = header.find(':');
            if (colon == std::string::npos) continue;
            std::string key = lowered(trimmed(header.substr(0, colon)));
            std::string value = trimmed(header.substr(colon + 1));

            if (key == "content-disposition") readDisposition(value, part);
            else if (key == "content-type") part.contentType = value;
        }

        size_t dataStart = headersEnd + 4;
        size_t next = body.find("\r\n" + delimiter, dataStart);
        size_t dataEnd = next == std::string::npos ? body.size() : next;
        part.data = body.substr(dataStart, dataEnd - dataStart);
        parts.push_back(std::move(part));

        cursor = next == std::string::npos ? next : next + 2;
    }

    return parts;
}

} // namespace test
} // namespace uppy
