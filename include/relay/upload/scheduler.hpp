#pragma once

#include "relay/core/errors.hpp"
#include "relay/core/result.hpp"
#include "relay/upload/chunk_source.hpp"
#include "relay/upload/part_uploader.hpp"
#include "relay/upload/types.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace relay::upload {

namespace asio = boost::asio;

struct SchedulerOptions {
    std::size_t max_concurrent_parts = 4;
    std::uint32_t max_retries = 3;
    std::chrono::milliseconds backoff_base{1000};
    FailurePolicy failure_policy = FailurePolicy::FailFast;
    std::optional<std::chrono::steady_clock::duration> deadline;
};

/**
 * @brief Totals of a fully acknowledged upload
 */
struct UploadSummary {
    FileId file_id = 0;
    std::uint32_t parts_acknowledged = 0;
    std::uint64_t bytes_sent = 0;
    std::uint32_t retries = 0;
};

/**
 * @brief Optional per-part notifications, called on the scheduler's strand
 */
struct SchedulerHooks {
    std::function<void(std::uint32_t index, std::size_t bytes)> on_part_acknowledged;
    std::function<void(std::uint32_t index, std::uint32_t attempt, std::chrono::milliseconds delay,
                       const UploadError& cause)> on_retry_scheduled;
};

using UploadCompletion = std::function<void(Result<UploadSummary, UploadError>)>;

/**
 * @brief Drives PartUploader over every index of a plan
 *
 * Lifecycle of one upload:
 * 1. Indices are admitted in order while the AdmissionGate has room
 * 2. A part holds its slot across retries and backoff waits
 * 3. TransportFailure is retried after backoff_base * 2^(attempt-1)
 * 4. Any other error, or an exhausted retry budget, fails the upload
 * 5. The completion runs once, after in-flight parts have drained
 *    (or immediately when the deadline expires)
 *
 * All bookkeeping runs on an internal strand of @p io. Transport
 * completions are posted back onto it, so the transport may call back from
 * any thread. The PartUploader must outlive every upload started here.
 */
class UploadScheduler {
public:
    UploadScheduler(asio::io_context& io, PartUploader& uploader, SchedulerOptions options);

    void async_upload(const UploadPlan& plan,
                      std::shared_ptr<const ChunkSource> source,
                      FileId file_id,
                      UploadCompletion on_complete,
                      SchedulerHooks hooks = {});

    /// Wait before the next attempt after attempt number @p failed_attempt (1-based) failed.
    static std::chrono::milliseconds backoff_delay(std::chrono::milliseconds base,
                                                   std::uint32_t failed_attempt) noexcept;

private:
    asio::io_context& io_;
    PartUploader& uploader_;
    SchedulerOptions options_;
};

} // namespace relay::upload
