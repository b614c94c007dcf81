#ifndef VSTORE_ERRORS_STORAGE_ERROR_HPP
#define VSTORE_ERRORS_STORAGE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace vstore::errors {

// Failure kinds surfaced to the calling layer
enum class ErrorKind {
    NOT_FOUND = 0,
    INVALID_IDENTIFIER,
    INVALID_FILTER,
    EMPTY_BUNDLE,
    STORAGE_UNAVAILABLE,
    BUNDLE_ABORTED
};

const char* error_kind_to_string(ErrorKind kind);
// HTTP-like status a calling layer should answer with
int error_kind_to_status(ErrorKind kind);

class StorageError : public std::runtime_error {
public:
    StorageError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }
    int status() const { return error_kind_to_status(kind_); }

private:
    ErrorKind kind_;
};

class NotFound : public StorageError {
public:
    explicit NotFound(const std::string& message)
        : StorageError(ErrorKind::NOT_FOUND, message) {}
};

class InvalidIdentifier : public StorageError {
public:
    explicit InvalidIdentifier(const std::string& id)
        : StorageError(ErrorKind::INVALID_IDENTIFIER, "Invalid identifier: " + id) {}
};

class InvalidFilter : public StorageError {
public:
    explicit InvalidFilter(const std::string& message)
        : StorageError(ErrorKind::INVALID_FILTER, "Invalid filter: " + message) {}
};

class EmptyBundle : public StorageError {
public:
    explicit EmptyBundle(const std::string& message)
        : StorageError(ErrorKind::EMPTY_BUNDLE, message) {}
};

class StorageUnavailable : public StorageError {
public:
    explicit StorageUnavailable(const std::string& message)
        : StorageError(ErrorKind::STORAGE_UNAVAILABLE, "Storage unavailable: " + message) {}
};

class BundleAborted : public StorageError {
public:
    explicit BundleAborted(const std::string& message)
        : StorageError(ErrorKind::BUNDLE_ABORTED, "Bundle aborted: " + message) {}
};

} // namespace vstore::errors

#endif // VSTORE_ERRORS_STORAGE_ERROR_HPP
