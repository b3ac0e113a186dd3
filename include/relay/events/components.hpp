/**
 * @file components.hpp
 * @brief Event-driven observers of the upload pipeline
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Both react to every upload from now on
 */

#pragma once

#include "relay/events/event_bus.hpp"
#include "relay/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace relay::events {

/**
 * @brief Logs every upload event through spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadStartedEvent>([this](const UploadStartedEvent& e) {
            on_upload_started(e);
        });

        bus_.subscribe<PartAcknowledgedEvent>([this](const PartAcknowledgedEvent& e) {
            on_part_acknowledged(e);
        });

        bus_.subscribe<PartRetryScheduledEvent>([this](const PartRetryScheduledEvent& e) {
            on_retry_scheduled(e);
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            on_upload_completed(e);
        });

        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent& e) {
            on_upload_failed(e);
        });
    }

private:
    void on_upload_started(const UploadStartedEvent& e) {
        spdlog::info("[UploadStarted] file={} name={} bytes={} parts={} protocol={} tier={}",
                     e.file_id, e.display_name, e.file_size, e.total_parts,
                     upload::to_string(e.protocol), upload::to_string(e.tier));
    }

    void on_part_acknowledged(const PartAcknowledgedEvent& e) {
        spdlog::debug("[PartAcknowledged] file={} part={}/{} bytes={}",
                      e.file_id, e.part_index + 1, e.total_parts, e.bytes);
    }

    void on_retry_scheduled(const PartRetryScheduledEvent& e) {
        spdlog::warn("[PartRetry] file={} part={} attempt={} delay={}ms reason={}",
                     e.file_id, e.part_index, e.attempt, e.delay.count(), e.reason);
    }

    void on_upload_completed(const UploadCompletedEvent& e) {
        spdlog::info("[UploadCompleted] file={} name={} bytes={} parts={} protocol={} duration={}ms",
                     e.file_id, e.display_name, e.total_bytes, e.parts,
                     upload::to_string(e.protocol), e.duration.count());
    }

    void on_upload_failed(const UploadFailedEvent& e) {
        spdlog::error("[UploadFailed] file={} name={} kind={} message={}",
                      e.file_id, e.display_name, to_string(e.kind), e.message);
    }

    EventBus& bus_;
};

/**
 * @brief Counts uploads, parts and bytes
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> uploads_started{0};
        std::atomic<std::uint64_t> uploads_completed{0};
        std::atomic<std::uint64_t> uploads_failed{0};
        std::atomic<std::uint64_t> uploads_rate_limited{0};
        std::atomic<std::uint64_t> parts_acknowledged{0};
        std::atomic<std::uint64_t> part_retries{0};
        std::atomic<std::uint64_t> bytes_uploaded{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadStartedEvent>([this](const UploadStartedEvent&) {
            stats_.uploads_started++;
        });

        bus_.subscribe<PartAcknowledgedEvent>([this](const PartAcknowledgedEvent&) {
            stats_.parts_acknowledged++;
        });

        bus_.subscribe<PartRetryScheduledEvent>([this](const PartRetryScheduledEvent&) {
            stats_.part_retries++;
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            stats_.uploads_completed++;
            stats_.bytes_uploaded += e.total_bytes;
        });

        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent& e) {
            stats_.uploads_failed++;
            if (e.kind == UploadErrorKind::RateLimited) {
                stats_.uploads_rate_limited++;
            }
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Uploads started:   {}", stats_.uploads_started.load());
        spdlog::info("  Uploads completed: {}", stats_.uploads_completed.load());
        spdlog::info("  Uploads failed:    {}", stats_.uploads_failed.load());
        spdlog::info("  Rate limited:      {}", stats_.uploads_rate_limited.load());
        spdlog::info("  Parts acked:       {}", stats_.parts_acknowledged.load());
        spdlog::info("  Part retries:      {}", stats_.part_retries.load());
        spdlog::info("  Bytes uploaded:    {}", stats_.bytes_uploaded.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace relay::events
