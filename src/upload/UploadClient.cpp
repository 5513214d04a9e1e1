#include "upload/UploadClient.hpp"
#include "const/defaults.hpp"
#include <curl/curl.h>
#include <fstream>
#include <iostream>
#include <memory>
#include <cstring>
#include <cerrno>

namespace uppy {

namespace {
    size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
        size_t totalSize = size * nmemb;
        userp->append(static_cast<char*>(contents), totalSize);
        return totalSize;
    }
}

UploadClient::UploadClient(const std::string& host, const std::string& token)
    : host_(host), token_(token) {}

UploadClient::UploadClient(const Configuration& config)
    : UploadClient(config.host, config.token) {}

std::string UploadClient::getUploadUrl() const {
    return host_ + UPLOAD_ROUTE;
}

std::vector<std::string> UploadClient::constructHeaders() const {
    // curl drops "Name: " with a blank value; "Name;" sends it empty
    return {
        token_.empty() ? std::string("Authorization;") : "Authorization: " + token_,
        "Format: RANDOM",
        "Embed: true"
    };
}

std::optional<std::string> UploadClient::readFileBytes(const std::filesystem::path& filePath, std::string& error) {
    std::error_code ec;
    auto status = std::filesystem::status(filePath, ec);
    if (ec) {
        error = filePath.string() + ": " + ec.message();
        return std::nullopt;
    }
    if (!std::filesystem::is_regular_file(status)) {
        error = filePath.string() + ": not a regular file";
        return std::nullopt;
    }

    std::ifstream inFile(filePath, std::ios::binary);
    if (!inFile) {
        error = filePath.string() + ": " + std::strerror(errno);
        return std::nullopt;
    }

    std::string content((std::istreambuf_iterator<char>(inFile)),
                        std::istreambuf_iterator<char>());
    if (inFile.bad()) {
        error = filePath.string() + ": read failed";
        return std::nullopt;
    }
    return content;
}

UploadOutcome UploadClient::classify(long httpCode, std::string body) {
    if (httpCode >= 400 && httpCode < 500) {
        return ClientError{httpCode};
    }
    if (httpCode >= 500 && httpCode < 600) {
        return ServerError{httpCode};
    }
    return UploadSuccess{httpCode, std::move(body)};
}

UploadOutcome UploadClient::upload(const std::filesystem::path& filePath) const {
    if (containsControlCharacters(token_)) {
        return IoFailure{"token contains control characters and cannot be sent as a header"};
    }

    std::string error;
    auto content = readFileBytes(filePath, error);
    if (!content) {
        return IoFailure{error};
    }

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        return TransportFailure{"Failed to initialize CURL"};
    }

    std::unique_ptr<curl_mime, decltype(&curl_mime_free)> form(curl_mime_init(curl.get()), curl_mime_free);
    curl_mimepart* part = form ? curl_mime_addpart(form.get()) : nullptr;
    if (!part) {
        return IoFailure{"Failed to build multipart form"};
    }

    CURLcode rc = curl_mime_name(part, UPLOAD_FIELD_NAME);
    if (rc == CURLE_OK) rc = curl_mime_filename(part, filePath.filename().string().c_str());
    if (rc == CURLE_OK) rc = curl_mime_data(part, content->data(), content->size());
    if (rc != CURLE_OK) {
        return IoFailure{std::string("Failed to build multipart form: ") + curl_easy_strerror(rc)};
    }

    struct curl_slist* rawHeaders = nullptr;
    for (const auto& header : constructHeaders()) {
        rawHeaders = curl_slist_append(rawHeaders, header.c_str());
    }
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headerList(rawHeaders, curl_slist_free_all);

    std::string url = getUploadUrl();
    std::string response;
    char errorBuffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, form.get());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);

    if (verbose_) {
        std::cerr << "DEBUG: POST " << url << " (" << content->size() << " bytes from "
                  << filePath.string() << ")" << std::endl;
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        std::string reason = curl_easy_strerror(res);
        if (errorBuffer[0] != '\0') {
            reason += std::string(": ") + errorBuffer;
        }
        if (verbose_) {
            std::cerr << "DEBUG CURL error: " << reason << std::endl;
        }
        return TransportFailure{reason};
    }

    long httpCode = 0;
    res = curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &httpCode);
    if (res != CURLE_OK) {
        return TransportFailure{std::string("Failed to read response status: ") + curl_easy_strerror(res)};
    }

    if (verbose_) {
        std::cerr << "DEBUG HTTP code: " << httpCode << std::endl;
        std::cerr << "DEBUG: Response (" << response.size() << " bytes): "
                  << response.substr(0, 500) << std::endl;
    }

    return classify(httpCode, std::move(response));
}

} // namespace uppy
