#include "pitwall/support/error.hpp"

#include <utility>

namespace pitwall::support {

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "OK";
        case ErrorKind::Config: return "CONFIG_ERROR";
        case ErrorKind::Parse: return "PARSE_ERROR";
        case ErrorKind::Identity: return "IDENTITY_ERROR";
        case ErrorKind::Import: return "IMPORT_ERROR";
        case ErrorKind::Stream: return "STREAM_ERROR";
    }
    return "UNKNOWN_ERROR";
}

std::string Error::describe(bool with_cause) const {
    std::string out = to_string(kind) + ": " + message;
    if (with_cause && !cause.empty()) out += " (cause: " + cause + ")";
    return out;
}

bool fail(Error* error, ErrorKind kind, std::string message, std::string cause) {
    if (error) {
        error->kind = kind;
        error->message = std::move(message);
        error->cause = std::move(cause);
    }
    return false;
}

} // namespace pitwall::support
