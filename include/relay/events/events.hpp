/**
 * @file events.hpp
 * @brief Event types emitted by the upload pipeline
 *
 * NAMING CONVENTION:
 * - Events are past-tense: UploadStartedEvent, PartAcknowledgedEvent
 *
 * WHO EMITS: MediaUploadService
 * WHO SUBSCRIBES: LoggerComponent, MetricsComponent, tests
 */

#pragma once

#include "relay/core/errors.hpp"
#include "relay/upload/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace relay::events {

// ════════════════════════════════════════════════════════
// Upload Lifecycle Events
// ════════════════════════════════════════════════════════

struct UploadStartedEvent {
    upload::FileId file_id = 0;
    std::string display_name;
    std::uint64_t file_size = 0;
    std::uint32_t total_parts = 0;
    upload::UploadProtocol protocol = upload::UploadProtocol::Small;
    upload::AccountTier tier = upload::AccountTier::Regular;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct PartAcknowledgedEvent {
    upload::FileId file_id = 0;
    std::uint32_t part_index = 0;
    std::uint32_t total_parts = 0;
    std::size_t bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct PartRetryScheduledEvent {
    upload::FileId file_id = 0;
    std::uint32_t part_index = 0;
    std::uint32_t attempt = 0;  ///< Attempt that just failed, 1-based
    std::chrono::milliseconds delay{0};
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadCompletedEvent {
    upload::FileId file_id = 0;
    std::string display_name;
    std::uint64_t total_bytes = 0;
    std::uint32_t parts = 0;
    upload::UploadProtocol protocol = upload::UploadProtocol::Small;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Terminal failure of one upload attempt
 *
 * file_id is 0 when the attempt failed before an identifier was drawn.
 */
struct UploadFailedEvent {
    upload::FileId file_id = 0;
    std::string display_name;
    UploadErrorKind kind = UploadErrorKind::TransportFailure;
    std::string message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace relay::events
