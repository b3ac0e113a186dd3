#pragma once

#include "relay/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace relay::upload {

/**
 * @brief One saveFilePart / saveBigFilePart call
 */
struct PartRequest {
    FileId file_id = 0;
    std::uint32_t part_index = 0;
    std::uint32_t total_parts = 0;
    SharedBytes bytes;
};

enum class TransportCode {
    Ok,
    RateLimited,
    Failed
};

struct TransportStatus {
    TransportCode code = TransportCode::Ok;
    std::string message;
    std::optional<std::chrono::seconds> retry_after;

    static TransportStatus ok() { return {}; }

    static TransportStatus rate_limited(std::string msg, std::optional<std::chrono::seconds> wait = std::nullopt) {
        return {TransportCode::RateLimited, std::move(msg), wait};
    }

    static TransportStatus failed(std::string msg) {
        return {TransportCode::Failed, std::move(msg), std::nullopt};
    }

    [[nodiscard]] bool is_ok() const noexcept { return code == TransportCode::Ok; }
};

using TransportCallback = std::function<void(TransportStatus)>;

/**
 * @brief Wire surface of the messaging platform
 *
 * Implementations may complete on any thread, and may complete inline.
 * The callback must be invoked exactly once per call.
 */
class PartTransport {
public:
    virtual ~PartTransport() = default;

    virtual void save_file_part(PartRequest request, TransportCallback done) = 0;

    virtual void save_big_file_part(PartRequest request, TransportCallback done) = 0;
};

} // namespace relay::upload
