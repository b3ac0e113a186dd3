#include "relay/core/errors.hpp"

#include <sstream>

namespace relay {

const char* to_string(UploadErrorKind kind) noexcept {
    switch (kind) {
        case UploadErrorKind::RejectedPlan: return "RejectedPlan";
        case UploadErrorKind::PartLimitExceeded: return "PartLimitExceeded";
        case UploadErrorKind::FileTooLarge: return "FileTooLarge";
        case UploadErrorKind::EmptyChunk: return "EmptyChunk";
        case UploadErrorKind::OversizedChunk: return "OversizedChunk";
        case UploadErrorKind::RateLimited: return "RateLimited";
        case UploadErrorKind::TransportFailure: return "TransportFailure";
        case UploadErrorKind::TimedOut: return "TimedOut";
        case UploadErrorKind::Io: return "Io";
    }
    return "Unknown";
}

bool is_retryable(UploadErrorKind kind) noexcept {
    return kind == UploadErrorKind::TransportFailure;
}

FailureReason failure_reason(const UploadError& error) noexcept {
    switch (error.kind) {
        case UploadErrorKind::RejectedPlan:
        case UploadErrorKind::PartLimitExceeded:
        case UploadErrorKind::FileTooLarge:
            return FailureReason::SizeExceeded;
        case UploadErrorKind::RateLimited:
            return FailureReason::RateLimited;
        default:
            return FailureReason::UploadFailed;
    }
}

const char* user_message(FailureReason reason) noexcept {
    switch (reason) {
        case FailureReason::SizeExceeded:
            return "File exceeds the maximum allowed size";
        case FailureReason::RateLimited:
            return "Upload limit reached for this account, try again later";
        case FailureReason::UploadFailed:
            return "Failed to send the file";
    }
    return "Failed to send the file";
}

std::string describe(const UploadError& error) {
    std::ostringstream oss;
    oss << to_string(error.kind) << ": " << error.message;
    if (error.part_index) {
        oss << " (part " << *error.part_index << ")";
    }
    if (error.retry_after) {
        oss << " retry_after=" << error.retry_after->count() << "s";
    }
    return oss.str();
}

} // namespace relay
