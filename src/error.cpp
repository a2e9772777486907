#include "stmeta/error.hpp"

namespace stmeta {

StmetaError::StmetaError(ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind_(k) {}

ErrorKind StmetaError::kind() const noexcept { return kind_; }

std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::TruncatedInput: return "truncated_input";
        case ErrorKind::InvalidEncoding: return "invalid_encoding";
        case ErrorKind::MalformedHeader: return "malformed_header";
        case ErrorKind::NoMetadata: return "no_metadata";
        case ErrorKind::SerializationError: return "serialization_error";
        case ErrorKind::InvalidJson: return "invalid_json";
        case ErrorKind::Io: return "io";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::AccessDenied: return "access_denied";
        case ErrorKind::Unsupported: return "unsupported";
        case ErrorKind::VerificationFailed: return "verification_failed";
    }
    return "unknown";
}

} // namespace stmeta
