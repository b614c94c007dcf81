#include "errors/storage_error.hpp"

namespace vstore::errors {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_FOUND: return "Not found";
        case ErrorKind::INVALID_IDENTIFIER: return "Invalid identifier";
        case ErrorKind::INVALID_FILTER: return "Invalid filter";
        case ErrorKind::EMPTY_BUNDLE: return "Empty bundle";
        case ErrorKind::STORAGE_UNAVAILABLE: return "Storage unavailable";
        case ErrorKind::BUNDLE_ABORTED: return "Bundle aborted";
        default: return "Undefined error";
    }
}

int error_kind_to_status(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_FOUND:
        case ErrorKind::EMPTY_BUNDLE:
            return 404;
        case ErrorKind::INVALID_IDENTIFIER:
        case ErrorKind::INVALID_FILTER:
            return 400;
        case ErrorKind::STORAGE_UNAVAILABLE:
            return 503;
        case ErrorKind::BUNDLE_ABORTED:
            return 499;
        default:
            return 500;
    }
}

} // namespace vstore::errors
