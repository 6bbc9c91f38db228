#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace sharpmap {

enum class ErrorCode {
    NotFound,
    PermissionDenied,
    InvalidArgument,
    Cancelled
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::PermissionDenied: return "PERMISSION_DENIED";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::Cancelled: return "CANCELLED";
    }
    return "UNKNOWN";
}

// Query-level failure. Per-file parse problems never become one of these;
// they travel as ParseWarning instead.
class AnalysisError : public std::runtime_error {
public:
    AnalysisError(ErrorCode code, const std::string& message, std::string subject = "")
        : std::runtime_error(message), code_(code), subject_(std::move(subject)) {}

    ErrorCode code() const { return code_; }
    const std::string& subject() const { return subject_; }

private:
    ErrorCode code_;
    std::string subject_;
};

} // namespace sharpmap
