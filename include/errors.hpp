#pragma once

#include <string>
#include <system_error>

namespace quickswitch {

enum class ErrorKind {
    NotFound,
    AccessDenied,
    NotADirectory,
    DecodeFailure,
    IoFailure,
    PersistenceFailure
};

struct Error {
    ErrorKind kind{ErrorKind::IoFailure};
    std::string message;
};

const char *error_kind_name(ErrorKind kind);

// Maps an OS-level error onto the navigator's taxonomy. Anything not covered by a
// dedicated kind becomes IoFailure.
ErrorKind classify_error_code(const std::error_code &ec);

Error make_error(const std::error_code &ec, const std::string &context);

}
