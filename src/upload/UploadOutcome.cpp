#include "upload/UploadOutcome.hpp"

namespace uppy {

std::string describe(const UploadOutcome& outcome) {
    if (const auto* success = std::get_if<UploadSuccess>(&outcome)) {
        return "Upload finished with HTTP " + std::to_string(success->status);
    }
    if (const auto* io = std::get_if<IoFailure>(&outcome)) {
        return "Something went wrong while loading the targeted file: " + io->reason;
    }
    if (const auto* transport = std::get_if<TransportFailure>(&outcome)) {
        return "Something went wrong while sending the HTTP request: " + transport->reason;
    }
    if (const auto* client = std::get_if<ClientError>(&outcome)) {
        return "A HTTP client error occurred, code: " + std::to_string(client->status);
    }
    const auto& server = std::get<ServerError>(outcome);
    return "A HTTP server error occurred, code: " + std::to_string(server.status);
}

} // namespace uppy
