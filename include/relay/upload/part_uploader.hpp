#pragma once

#include "relay/core/errors.hpp"
#include "relay/core/result.hpp"
#include "relay/upload/transport.hpp"
#include "relay/upload/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>

namespace relay::upload {

using PartCallback = std::function<void(Result<PartAck, UploadError>)>;

/**
 * @brief Sends exactly one part, with no retry of its own
 *
 * Preconditions are checked before the transport is touched. A file made of
 * a single part is acknowledged without a network call: it travels inline
 * with the outbound message instead.
 */
class PartUploader {
public:
    explicit PartUploader(PartTransport& transport);

    void upload_part(const UploadPlan& plan,
                     FileId file_id,
                     std::uint32_t index,
                     SharedBytes bytes,
                     PartCallback done);

    static Result<void, UploadError> check_preconditions(const UploadPlan& plan,
                                                         std::uint32_t index,
                                                         std::size_t length);

    static UploadError classify(const TransportStatus& status, std::uint32_t index);

private:
    PartTransport& transport_;
};

} // namespace relay::upload
