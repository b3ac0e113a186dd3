#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace relay {

/**
 * @brief Classified failure of an upload attempt
 *
 * Only TransportFailure is retried by the scheduler. Everything else is
 * terminal for the attempt the moment it is observed.
 */
enum class UploadErrorKind {
    RejectedPlan,       ///< Size or tier validation failed before any I/O
    PartLimitExceeded,  ///< Part count above the account tier's limit
    FileTooLarge,       ///< File above the configured maximum size
    EmptyChunk,         ///< Zero-length chunk produced or submitted
    OversizedChunk,     ///< Chunk longer than the part size
    RateLimited,        ///< Platform refused the part for account limits
    TransportFailure,   ///< Generic network or remote error
    TimedOut,           ///< Caller-supplied deadline expired
    Io                  ///< Local file could not be opened or read
};

/**
 * @brief Closed set of reasons shown to the end user
 */
enum class FailureReason {
    SizeExceeded,
    RateLimited,
    UploadFailed
};

struct UploadError {
    UploadErrorKind kind = UploadErrorKind::TransportFailure;
    std::string message;
    std::optional<std::uint32_t> part_index;
    std::optional<std::chrono::seconds> retry_after;  ///< Set for RateLimited when the platform says
    std::vector<std::uint32_t> failed_parts;           ///< Every index that failed permanently

    UploadError() = default;
    UploadError(UploadErrorKind k, std::string msg)
        : kind(k), message(std::move(msg)) {}

    UploadError& for_part(std::uint32_t index) {
        part_index = index;
        return *this;
    }
};

const char* to_string(UploadErrorKind kind) noexcept;

[[nodiscard]] bool is_retryable(UploadErrorKind kind) noexcept;

[[nodiscard]] FailureReason failure_reason(const UploadError& error) noexcept;

const char* user_message(FailureReason reason) noexcept;

/// "kind: message (part N)" for logs.
std::string describe(const UploadError& error);

} // namespace relay
