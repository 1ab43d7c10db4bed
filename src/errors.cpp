#include "errors.hpp"

namespace quickswitch {

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:           return "not found";
        case ErrorKind::AccessDenied:       return "access denied";
        case ErrorKind::NotADirectory:      return "not a directory";
        case ErrorKind::DecodeFailure:      return "decode failure";
        case ErrorKind::IoFailure:          return "I/O failure";
        case ErrorKind::PersistenceFailure: return "persistence failure";
    }
    return "unknown error";
}

ErrorKind classify_error_code(const std::error_code &ec) {
    if (ec == std::errc::no_such_file_or_directory) {
        return ErrorKind::NotFound;
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return ErrorKind::AccessDenied;
    }
    if (ec == std::errc::not_a_directory) {
        return ErrorKind::NotADirectory;
    }
    return ErrorKind::IoFailure;
}

Error make_error(const std::error_code &ec, const std::string &context) {
    Error error;
    error.kind = classify_error_code(ec);
    error.message = context + ": " + ec.message();
    return error;
}

}
