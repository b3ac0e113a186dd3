#pragma once

#include "relay/core/config.hpp"
#include "relay/core/errors.hpp"
#include "relay/core/result.hpp"
#include "relay/events/event_bus.hpp"
#include "relay/events/progress.hpp"
#include "relay/upload/checksum.hpp"
#include "relay/upload/part_uploader.hpp"
#include "relay/upload/protocol_selector.hpp"
#include "relay/upload/scheduler.hpp"
#include "relay/upload/transport.hpp"
#include "relay/upload/types.hpp"

#include <boost/asio.hpp>

#include <functional>

namespace relay::upload {

using IdGenerator = std::function<FileId()>;

/// Non-zero identifiers from a std::mt19937_64 seeded by std::random_device.
IdGenerator make_random_id_generator();

using AttachmentHandler = std::function<void(Result<MediaAttachment, UploadError>)>;

/**
 * @brief Upload pipeline from a local file to an attachable reference
 *
 * size gate -> ProtocolSelector -> UploadScheduler -> ChecksumComputer
 * (small protocol only) -> build_file_reference -> MediaAttachment.
 *
 * Lifecycle events go to the EventBus; when a progress channel is set,
 * the same milestones are pushed there for the status-message consumer.
 */
class MediaUploadService {
public:
    MediaUploadService(boost::asio::io_context& io,
                       PartTransport& transport,
                       UploadConfig config,
                       events::EventBus& bus,
                       IdGenerator ids = make_random_id_generator());

    void set_progress_channel(events::ProgressChannel* channel) noexcept { progress_ = channel; }

    /**
     * @brief Start an upload; @p handler runs once on the io_context
     *
     * The service, the transport and the bus must outlive the upload.
     */
    void async_upload(UploadRequest request, AttachmentHandler handler);

    /**
     * @brief Run one upload to completion on the io_context
     *
     * Drives io.run() on the calling thread, so nothing else may be running
     * the same io_context.
     */
    Result<MediaAttachment, UploadError> upload(UploadRequest request);

private:
    struct Attempt;

    void finish(const std::shared_ptr<Attempt>& attempt, Result<UploadSummary, UploadError> outcome);
    void fail(const std::shared_ptr<Attempt>& attempt, UploadError error);
    void publish(events::ProgressEvent event, bool terminal);

    boost::asio::io_context& io_;
    UploadConfig config_;
    events::EventBus& bus_;
    IdGenerator ids_;
    ProtocolSelector selector_;
    PartUploader uploader_;
    UploadScheduler scheduler_;
    ChecksumComputer checksum_;
    events::ProgressChannel* progress_ = nullptr;
};

} // namespace relay::upload
