#include "relay/upload/part_uploader.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace relay::upload {

PartUploader::PartUploader(PartTransport& transport)
    : transport_(transport) {}

Result<void, UploadError> PartUploader::check_preconditions(const UploadPlan& plan,
                                                            std::uint32_t index,
                                                            std::size_t length) {
    if (plan.total_parts > plan.part_limit) {
        return Err(UploadError(UploadErrorKind::PartLimitExceeded,
                               std::to_string(plan.total_parts) + " parts exceed limit " +
                               std::to_string(plan.part_limit)).for_part(index));
    }
    if (index >= plan.total_parts) {
        return Err(UploadError(UploadErrorKind::RejectedPlan,
                               "part index out of range of " + std::to_string(plan.total_parts)).for_part(index));
    }
    if (length > plan.part_size) {
        return Err(UploadError(UploadErrorKind::OversizedChunk,
                               std::to_string(length) + " bytes exceed part size " +
                               std::to_string(plan.part_size)).for_part(index));
    }
    if (length == 0) {
        return Err(UploadError(UploadErrorKind::EmptyChunk, "chunk has no bytes").for_part(index));
    }
    if (length != plan.expected_length(index)) {
        return Err(UploadError(UploadErrorKind::RejectedPlan,
                               "chunk is " + std::to_string(length) + " bytes, expected " +
                               std::to_string(plan.expected_length(index))).for_part(index));
    }
    return Ok();
}

UploadError PartUploader::classify(const TransportStatus& status, std::uint32_t index) {
    UploadError error;
    if (status.code == TransportCode::RateLimited) {
        error = UploadError(UploadErrorKind::RateLimited, status.message);
        error.retry_after = status.retry_after;
    } else {
        error = UploadError(UploadErrorKind::TransportFailure, status.message);
    }
    error.part_index = index;
    return error;
}

void PartUploader::upload_part(const UploadPlan& plan,
                               FileId file_id,
                               std::uint32_t index,
                               SharedBytes bytes,
                               PartCallback done) {
    const std::size_t length = bytes ? bytes->size() : 0;
    if (auto check = check_preconditions(plan, index, length); check.is_error()) {
        done(Err(check.error()));
        return;
    }

    if (plan.total_parts == 1) {
        spdlog::debug("file {} is a single part, sent inline", file_id);
        done(Ok(PartAck{file_id, index, length, false}));
        return;
    }

    PartRequest request{file_id, index, plan.total_parts, std::move(bytes)};
    auto on_status = [done = std::move(done), file_id, index, length](TransportStatus status) {
        if (status.is_ok()) {
            done(Ok(PartAck{file_id, index, length, true}));
        } else {
            done(Err(classify(status, index)));
        }
    };

    if (plan.protocol == UploadProtocol::Big) {
        transport_.save_big_file_part(std::move(request), std::move(on_status));
    } else {
        transport_.save_file_part(std::move(request), std::move(on_status));
    }
}

} // namespace relay::upload
