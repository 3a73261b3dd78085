#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

// Rejected input: empty identifiers, malformed descriptors, missing fields.
// Raised before any side effect is attempted.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message) : std::runtime_error(message) {}
};

// No strategy registered for the requested deployment profile type
class UnsupportedProfileError : public std::runtime_error {
public:
    UnsupportedProfileError(const std::string& requested_type, std::vector<std::string> available_types);

    const std::string& requestedType() const { return requested_type_; }
    const std::vector<std::string>& availableTypes() const { return available_types_; }

private:
    std::string requested_type_;
    std::vector<std::string> available_types_;
};

// The deployment or monitoring backend failed. The original exception is
// kept so callers can rethrow and inspect it.
class BackendError : public std::runtime_error {
public:
    BackendError(const std::string& operation, const std::string& workload_id, std::exception_ptr cause);

    const std::string& operation() const { return operation_; }
    const std::string& workloadId() const { return workload_id_; }
    std::exception_ptr cause() const { return cause_; }

private:
    std::string operation_;
    std::string workload_id_;
    std::exception_ptr cause_;
};

class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& message) : std::runtime_error(message) {}
};

// State store read failure surfaced by the watcher or the manager
class StoreError : public std::runtime_error {
public:
    StoreError(const std::string& message, std::exception_ptr cause)
        : std::runtime_error(message), cause_(cause) {}

    std::exception_ptr cause() const { return cause_; }

private:
    std::exception_ptr cause_;
};

class NotImplementedError : public std::runtime_error {
public:
    explicit NotImplementedError(const std::string& message) : std::runtime_error(message) {}
};

// Message of an exception_ptr, or "unknown error" for non-std exceptions
std::string describeException(std::exception_ptr error);

std::string joinTypes(const std::vector<std::string>& types);
