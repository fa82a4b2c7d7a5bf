#pragma once

#include <string>

namespace pitwall::support {

enum class ErrorKind {
    None,
    Config,
    Parse,
    Identity,
    Import,
    Stream,
};

std::string to_string(ErrorKind kind);

// Filled through a pointer out-parameter by every fallible call, next to a bool
// return. `cause` carries the lower-level message (sqlite, filesystem) when the
// failure wraps one.
struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    std::string cause;

    bool ok() const { return kind == ErrorKind::None; }
    std::string describe(bool with_cause) const;
};

// Writes into *error when the caller asked for it; always returns false so call
// sites can `return fail(...)`.
bool fail(Error* error, ErrorKind kind, std::string message, std::string cause = {});

} // namespace pitwall::support
