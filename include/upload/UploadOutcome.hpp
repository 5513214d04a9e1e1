#pragma once

#include <string>
#include <variant>

namespace uppy {

// Completed request with a non-error status; body already read off the connection
struct UploadSuccess {
    long status = 0;
    std::string body;
};

// The file could not be turned into a multipart form
struct IoFailure {
    std::string reason;
};

// The request never completed (DNS, connect, TLS, timeout)
struct TransportFailure {
    std::string reason;
};

struct ClientError {
    long status = 0;
};

struct ServerError {
    long status = 0;
};

using UploadOutcome = std::variant<UploadSuccess, IoFailure, TransportFailure, ClientError, ServerError>;

// Human-readable line for a failed outcome (or a short note for success)
std::string describe(const UploadOutcome& outcome);

inline bool isSuccess(const UploadOutcome& outcome) {
    return std::holds_alternative<UploadSuccess>(outcome);
}

} // namespace uppy
