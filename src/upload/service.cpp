#include "relay/upload/service.hpp"

#include "relay/events/events.hpp"
#include "relay/upload/chunk_source.hpp"
#include "relay/upload/file_reference.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <random>
#include <system_error>

namespace relay::upload {
namespace fs = std::filesystem;

namespace {

constexpr const char* kVideoCaption = "Download complete";

SchedulerOptions scheduler_options(const UploadConfig& config) {
    SchedulerOptions options;
    options.max_concurrent_parts = config.max_concurrent_parts;
    options.max_retries = config.max_retries;
    options.backoff_base = config.backoff_base;
    options.failure_policy = config.failure_policy;
    if (config.upload_timeout.count() > 0) {
        options.deadline = config.upload_timeout;
    }
    return options;
}

} // namespace

IdGenerator make_random_id_generator() {
    struct State {
        std::mutex mutex;
        std::mt19937_64 engine{std::random_device{}()};
    };
    auto state = std::make_shared<State>();
    return [state]() {
        std::lock_guard lock(state->mutex);
        FileId id = 0;
        while (id == 0) {
            id = state->engine();
        }
        return id;
    };
}

struct MediaUploadService::Attempt {
    UploadRequest request;
    UploadPlan plan;
    FileId file_id = 0;
    AttachmentHandler handler;
    std::uint32_t parts_done = 0;
    std::uint64_t bytes_done = 0;
    std::chrono::steady_clock::time_point started_at{std::chrono::steady_clock::now()};
};

MediaUploadService::MediaUploadService(boost::asio::io_context& io,
                                       PartTransport& transport,
                                       UploadConfig config,
                                       events::EventBus& bus,
                                       IdGenerator ids)
    : io_(io),
      config_(std::move(config)),
      bus_(bus),
      ids_(ids ? std::move(ids) : make_random_id_generator()),
      selector_(config_),
      uploader_(transport),
      scheduler_(io, uploader_, scheduler_options(config_)) {}

void MediaUploadService::async_upload(UploadRequest request, AttachmentHandler handler) {
    auto attempt = std::make_shared<Attempt>();
    attempt->request = std::move(request);
    attempt->handler = std::move(handler);
    const auto& req = attempt->request;

    std::error_code ec;
    const auto on_disk = fs::file_size(req.file_path, ec);
    if (ec) {
        fail(attempt, UploadError(UploadErrorKind::Io, "Cannot read " + req.file_path.string() + ": " + ec.message()));
        return;
    }
    if (on_disk != req.file_size) {
        fail(attempt, UploadError(UploadErrorKind::RejectedPlan,
                                  "file is " + std::to_string(on_disk) + " bytes on disk, request says " +
                                  std::to_string(req.file_size)));
        return;
    }
    if (req.file_size > config_.max_file_size) {
        fail(attempt, UploadError(UploadErrorKind::FileTooLarge,
                                  std::to_string(req.file_size) + " bytes exceed the maximum of " +
                                  std::to_string(config_.max_file_size)));
        return;
    }

    auto plan = selector_.select(req.file_size, req.tier);
    if (plan.is_error()) {
        fail(attempt, plan.error());
        return;
    }
    attempt->plan = plan.value();

    auto source = ChunkSource::open(req.file_path, attempt->plan.part_size);
    if (source.is_error()) {
        fail(attempt, source.error());
        return;
    }

    attempt->file_id = ids_();

    bus_.emit(events::UploadStartedEvent{attempt->file_id, req.display_name, attempt->plan.file_size,
                                         attempt->plan.total_parts, attempt->plan.protocol, req.tier});
    publish(events::ProgressEvent{attempt->file_id, events::ProgressStage::Started, 0,
                                  attempt->plan.total_parts, 0, attempt->plan.file_size, req.display_name},
            false);

    SchedulerHooks hooks;
    hooks.on_part_acknowledged = [this, attempt](std::uint32_t index, std::size_t bytes) {
        ++attempt->parts_done;
        attempt->bytes_done += bytes;
        bus_.emit(events::PartAcknowledgedEvent{attempt->file_id, index, attempt->plan.total_parts, bytes});
        publish(events::ProgressEvent{attempt->file_id, events::ProgressStage::PartAcknowledged,
                                      attempt->parts_done, attempt->plan.total_parts,
                                      attempt->bytes_done, attempt->plan.file_size, {}},
                false);
    };
    hooks.on_retry_scheduled = [this, attempt](std::uint32_t index, std::uint32_t attempt_number,
                                               std::chrono::milliseconds delay, const UploadError& cause) {
        bus_.emit(events::PartRetryScheduledEvent{attempt->file_id, index, attempt_number, delay, cause.message});
        publish(events::ProgressEvent{attempt->file_id, events::ProgressStage::PartRetrying,
                                      attempt->parts_done, attempt->plan.total_parts,
                                      attempt->bytes_done, attempt->plan.file_size,
                                      "part " + std::to_string(index + 1) + " in " +
                                      std::to_string(delay.count()) + "ms"},
                false);
    };

    scheduler_.async_upload(attempt->plan, std::move(source.value()), attempt->file_id,
        [this, attempt](Result<UploadSummary, UploadError> outcome) {
            finish(attempt, std::move(outcome));
        },
        std::move(hooks));
}

void MediaUploadService::finish(const std::shared_ptr<Attempt>& attempt,
                                Result<UploadSummary, UploadError> outcome) {
    if (outcome.is_error()) {
        fail(attempt, outcome.error());
        return;
    }

    std::optional<std::string> digest;
    if (attempt->plan.requires_checksum) {
        auto computed = checksum_.digest(attempt->request.file_path);
        if (computed.is_error()) {
            fail(attempt, computed.error());
            return;
        }
        digest = std::move(computed.value());
    }

    auto reference = build_file_reference(attempt->plan, attempt->file_id, attempt->request.display_name, digest);
    if (reference.is_error()) {
        fail(attempt, reference.error());
        return;
    }

    MediaAttachment attachment;
    attachment.reference = std::move(reference.value());
    if (attempt->request.is_audio) {
        attachment.kind = MediaKind::Audio;
        attachment.title = attempt->request.display_name;
    } else {
        attachment.kind = MediaKind::Video;
        attachment.caption = kVideoCaption;
        attachment.supports_streaming = true;
    }
    if (attempt->plan.total_parts == 1) {
        attachment.inline_file = attempt->request.file_path;
    }

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - attempt->started_at);
    bus_.emit(events::UploadCompletedEvent{attempt->file_id, attempt->request.display_name, attempt->plan.file_size,
                                           attempt->plan.total_parts, attempt->plan.protocol, duration});
    publish(events::ProgressEvent{attempt->file_id, events::ProgressStage::Completed,
                                  attempt->plan.total_parts, attempt->plan.total_parts,
                                  attempt->plan.file_size, attempt->plan.file_size, {}},
            true);

    attempt->handler(Ok(std::move(attachment)));
}

void MediaUploadService::fail(const std::shared_ptr<Attempt>& attempt, UploadError error) {
    bus_.emit(events::UploadFailedEvent{attempt->file_id, attempt->request.display_name, error.kind, error.message});
    publish(events::ProgressEvent{attempt->file_id, events::ProgressStage::Failed,
                                  attempt->parts_done, attempt->plan.total_parts,
                                  attempt->bytes_done, attempt->plan.file_size,
                                  user_message(failure_reason(error))},
            true);

    // Failures found before scheduling still reach the handler through the io_context.
    boost::asio::post(io_, [attempt, error = std::move(error)]() mutable {
        attempt->handler(Err(std::move(error)));
    });
}

void MediaUploadService::publish(events::ProgressEvent event, bool terminal) {
    if (progress_ == nullptr) {
        return;
    }
    const auto file_id = event.file_id;
    if (terminal) {
        progress_->push(std::move(event));
    } else if (!progress_->try_push(std::move(event))) {
        spdlog::trace("progress channel full, dropping event for file {}", file_id);
    }
}

Result<MediaAttachment, UploadError> MediaUploadService::upload(UploadRequest request) {
    std::optional<Result<MediaAttachment, UploadError>> outcome;
    async_upload(std::move(request), [&outcome](Result<MediaAttachment, UploadError> result) {
        outcome.emplace(std::move(result));
    });

    io_.restart();
    io_.run();

    if (!outcome) {
        return Err(UploadError(UploadErrorKind::TransportFailure, "upload did not complete"));
    }
    return std::move(*outcome);
}

} // namespace relay::upload
