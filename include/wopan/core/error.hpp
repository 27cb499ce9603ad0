#pragma once

#include "wopan/core/result.hpp"

#include <string>

namespace wopan {

/**
 * @brief Failure classes shared by the upload core, the extractor and the HTTP layer
 *
 * Retryable kinds (TransientTransport, ApplicationProtocol) never leave the
 * per-chunk retry procedure; once attempts are exhausted they are wrapped in
 * FatalProtocol.
 */
enum class ErrorKind {
    Validation,          ///< Bad caller input (unsupported type, not a regular file, ...)
    NotFound,            ///< File missing at call time
    MissingCredential,   ///< No access token configured
    InvalidCredential,   ///< Access token too short to derive a key
    TransientTransport,  ///< Network / TLS / timeout / non-2xx / unreadable body
    ApplicationProtocol, ///< Remote answered with a non-success code
    FatalProtocol,       ///< Retries exhausted or unrecoverable remote error
    Cancelled,           ///< Caller aborted the session
    Extraction,          ///< Video extraction collaborator failed
    Internal             ///< Local failure (crypto library, filesystem)
};

struct Error {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
};

inline Error make_error(ErrorKind kind, std::string message) {
    return Error{kind, std::move(message)};
}

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::MissingCredential: return "missing_credential";
        case ErrorKind::InvalidCredential: return "invalid_credential";
        case ErrorKind::TransientTransport: return "transient_transport";
        case ErrorKind::ApplicationProtocol: return "application_protocol";
        case ErrorKind::FatalProtocol: return "upload_error";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Extraction: return "extraction";
        case ErrorKind::Internal: return "internal";
    }
    return "unknown";
}

inline bool is_retryable(ErrorKind kind) {
    return kind == ErrorKind::TransientTransport || kind == ErrorKind::ApplicationProtocol;
}

template<typename T>
using Expected = Result<T, Error>;

} // namespace wopan
