#pragma once

#include <stdexcept>
#include <string>

namespace stmeta {

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    TruncatedInput,
    InvalidEncoding,
    MalformedHeader,
    NoMetadata,
    SerializationError,
    InvalidJson,
    Io,
    NotFound,
    AccessDenied,
    Unsupported,
    VerificationFailed,
};

class StmetaError : public std::runtime_error {
public:
    StmetaError(ErrorKind k, const std::string& msg);
    ErrorKind kind() const noexcept;

private:
    ErrorKind kind_;
};

std::string to_string(ErrorKind k);

} // namespace stmeta
