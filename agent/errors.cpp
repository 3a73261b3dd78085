#include "errors.h"
#include <sstream>

namespace {

std::string unsupportedMessage(const std::string& requested_type, const std::vector<std::string>& available) {
    return "unsupported deployment profile type: " + requested_type + " (available: " + joinTypes(available) + ")";
}

} // namespace

UnsupportedProfileError::UnsupportedProfileError(const std::string& requested_type,
                                                 std::vector<std::string> available_types)
    : std::runtime_error(unsupportedMessage(requested_type, available_types))
    , requested_type_(requested_type)
    , available_types_(std::move(available_types)) {
}

BackendError::BackendError(const std::string& operation, const std::string& workload_id, std::exception_ptr cause)
    : std::runtime_error(operation + " failed for " + workload_id + ": " + describeException(cause))
    , operation_(operation)
    , workload_id_(workload_id)
    , cause_(cause) {
}

std::string describeException(std::exception_ptr error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

std::string joinTypes(const std::vector<std::string>& types) {
    std::ostringstream out;
    out << "[";
    for (size_t i = 0; i < types.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << types[i];
    }
    out << "]";
    return out.str();
}
