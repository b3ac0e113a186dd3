#include "relay/upload/scheduler.hpp"

#include "relay/upload/admission_gate.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace relay::upload {

namespace {

struct PartTask {
    std::uint32_t index = 0;
    SharedBytes bytes;
    std::uint32_t attempts = 0;
};

/**
 * @brief State of one upload, kept alive by its pending handlers
 *
 * Every member is touched only from strand_, except gate_ which is atomic.
 */
class UploadJob : public std::enable_shared_from_this<UploadJob> {
public:
    UploadJob(asio::io_context& io,
              PartUploader& uploader,
              const SchedulerOptions& options,
              const UploadPlan& plan,
              std::shared_ptr<const ChunkSource> source,
              FileId file_id,
              UploadCompletion on_complete,
              SchedulerHooks hooks)
        : strand_(asio::make_strand(io)),
          work_(asio::make_work_guard(io)),
          deadline_timer_(strand_),
          uploader_(uploader),
          options_(options),
          plan_(plan),
          source_(std::move(source)),
          file_id_(file_id),
          on_complete_(std::move(on_complete)),
          hooks_(std::move(hooks)),
          gate_(options.max_concurrent_parts) {}

    void start() {
        asio::post(strand_, [self = shared_from_this()] { self->begin(); });
    }

private:
    void begin() {
        if (plan_.total_parts == 0 || !source_) {
            finished_ = true;
            complete(Err(UploadError(UploadErrorKind::RejectedPlan, "nothing to upload")));
            return;
        }
        if (source_->file_size() != plan_.file_size || source_->part_size() != plan_.part_size) {
            finished_ = true;
            complete(Err(UploadError(UploadErrorKind::RejectedPlan, "chunk source does not match the plan")));
            return;
        }

        spdlog::info("uploading file {}: {} bytes in {} parts via {} protocol",
                     file_id_, plan_.file_size, plan_.total_parts, to_string(plan_.protocol));

        if (options_.deadline) {
            deadline_timer_.expires_after(*options_.deadline);
            deadline_timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
                if (!ec) {
                    self->on_deadline();
                }
            });
        }
        pump();
    }

    void pump() {
        while (!finished_ && !stopping_ && next_index_ < plan_.total_parts && gate_.try_acquire()) {
            launch(next_index_++);
        }
        maybe_complete();
    }

    void launch(std::uint32_t index) {
        auto chunk = source_->read(index);
        if (chunk.is_error()) {
            record_failure(chunk.error());
            gate_.release();
            return;
        }

        auto task = std::make_shared<PartTask>();
        task->index = index;
        task->bytes = std::make_shared<const Bytes>(std::move(chunk.value().bytes));
        dispatch(task);
    }

    void dispatch(const std::shared_ptr<PartTask>& task) {
        ++task->attempts;
        spdlog::trace("file {} part {}/{} attempt {}", file_id_, task->index + 1, plan_.total_parts, task->attempts);

        uploader_.upload_part(plan_, file_id_, task->index, task->bytes,
            [self = shared_from_this(), task](Result<PartAck, UploadError> result) {
                asio::post(self->strand_, [self, task, result = std::move(result)]() mutable {
                    self->on_part_done(task, std::move(result));
                });
            });
    }

    void on_part_done(const std::shared_ptr<PartTask>& task, Result<PartAck, UploadError> result) {
        if (finished_) {
            return;
        }

        if (result.is_ok()) {
            ++acknowledged_;
            bytes_sent_ += result.value().bytes;
            if (hooks_.on_part_acknowledged) {
                hooks_.on_part_acknowledged(task->index, result.value().bytes);
            }
            gate_.release();
            pump();
            return;
        }

        UploadError error = std::move(result.error());
        if (stopping_) {
            spdlog::debug("discarding failure of part {} after upload abort: {}", task->index, error.message);
            gate_.release();
            maybe_complete();
            return;
        }

        if (is_retryable(error.kind) && task->attempts < options_.max_retries) {
            schedule_retry(task, error);
            return;
        }

        if (is_retryable(error.kind)) {
            error.message = "gave up after " + std::to_string(task->attempts) + " attempts: " + error.message;
        }
        record_failure(std::move(error));
        gate_.release();
        pump();
    }

    void schedule_retry(const std::shared_ptr<PartTask>& task, const UploadError& cause) {
        const auto delay = UploadScheduler::backoff_delay(options_.backoff_base, task->attempts);
        ++retries_;
        spdlog::warn("file {} part {} failed (attempt {}/{}): {}; retrying in {}ms",
                     file_id_, task->index, task->attempts, options_.max_retries, cause.message, delay.count());
        if (hooks_.on_retry_scheduled) {
            hooks_.on_retry_scheduled(task->index, task->attempts, delay, cause);
        }

        auto timer = std::make_shared<asio::steady_timer>(strand_, delay);
        backoff_timers_.insert(timer);
        timer->async_wait([self = shared_from_this(), task, timer](const boost::system::error_code& ec) {
            self->backoff_timers_.erase(timer);
            if (self->finished_) {
                return;
            }
            if (ec || self->stopping_) {
                self->gate_.release();
                self->maybe_complete();
                return;
            }
            self->dispatch(task);
        });
    }

    void record_failure(UploadError error) {
        spdlog::error("file {} failed permanently: {}", file_id_, describe(error));
        const bool fatal = !is_retryable(error.kind);
        failures_.push_back(std::move(error));

        if (fatal || options_.failure_policy == FailurePolicy::FailFast) {
            stopping_ = true;
            for (const auto& timer : backoff_timers_) {
                timer->cancel();
            }
        }
    }

    void maybe_complete() {
        if (finished_ || gate_.in_flight() != 0) {
            return;
        }
        if (!stopping_ && next_index_ < plan_.total_parts) {
            return;
        }

        finished_ = true;
        deadline_timer_.cancel();

        if (!failures_.empty()) {
            complete(Err(aggregate_failure()));
            return;
        }
        if (acknowledged_ != plan_.total_parts) {
            complete(Err(UploadError(UploadErrorKind::TransportFailure,
                                     std::to_string(acknowledged_) + " of " + std::to_string(plan_.total_parts) +
                                     " parts acknowledged")));
            return;
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at_);
        spdlog::info("file {} uploaded: {} parts, {} bytes, {} retries in {}ms",
                     file_id_, acknowledged_, bytes_sent_, retries_, elapsed.count());
        complete(Ok(UploadSummary{file_id_, acknowledged_, bytes_sent_, retries_}));
    }

    UploadError aggregate_failure() const {
        // A rate limit wins: it is the only failure the user can act on.
        auto chosen = std::find_if(failures_.begin(), failures_.end(), [](const UploadError& e) {
            return e.kind == UploadErrorKind::RateLimited;
        });
        UploadError error = chosen != failures_.end() ? *chosen : failures_.front();

        error.failed_parts.clear();
        for (const auto& failure : failures_) {
            if (failure.part_index) {
                error.failed_parts.push_back(*failure.part_index);
            }
        }
        std::sort(error.failed_parts.begin(), error.failed_parts.end());
        return error;
    }

    void on_deadline() {
        if (finished_) {
            return;
        }
        finished_ = true;
        stopping_ = true;
        for (const auto& timer : backoff_timers_) {
            timer->cancel();
        }
        spdlog::error("file {} did not finish before the deadline ({} of {} parts acknowledged)",
                      file_id_, acknowledged_, plan_.total_parts);
        complete(Err(UploadError(UploadErrorKind::TimedOut, "upload deadline expired")));
    }

    void complete(Result<UploadSummary, UploadError> result) {
        auto handler = std::move(on_complete_);
        on_complete_ = nullptr;
        if (handler) {
            handler(std::move(result));
        }
        work_.reset();
    }

    asio::strand<asio::io_context::executor_type> strand_;
    // Keeps io.run() alive while parts are out on transport threads
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    asio::steady_timer deadline_timer_;
    PartUploader& uploader_;
    SchedulerOptions options_;
    UploadPlan plan_;
    std::shared_ptr<const ChunkSource> source_;
    FileId file_id_;
    UploadCompletion on_complete_;
    SchedulerHooks hooks_;

    AdmissionGate gate_;
    std::uint32_t next_index_ = 0;
    std::uint32_t acknowledged_ = 0;
    std::uint64_t bytes_sent_ = 0;
    std::uint32_t retries_ = 0;
    bool stopping_ = false;
    bool finished_ = false;
    std::vector<UploadError> failures_;
    std::unordered_set<std::shared_ptr<asio::steady_timer>> backoff_timers_;
    std::chrono::steady_clock::time_point started_at_{std::chrono::steady_clock::now()};
};

} // namespace

UploadScheduler::UploadScheduler(asio::io_context& io, PartUploader& uploader, SchedulerOptions options)
    : io_(io),
      uploader_(uploader),
      options_(std::move(options)) {
    if (options_.max_concurrent_parts == 0) {
        options_.max_concurrent_parts = 1;
    }
    if (options_.max_retries == 0) {
        options_.max_retries = 1;
    }
}

void UploadScheduler::async_upload(const UploadPlan& plan,
                                   std::shared_ptr<const ChunkSource> source,
                                   FileId file_id,
                                   UploadCompletion on_complete,
                                   SchedulerHooks hooks) {
    auto job = std::make_shared<UploadJob>(io_, uploader_, options_, plan, std::move(source), file_id,
                                           std::move(on_complete), std::move(hooks));
    job->start();
}

std::chrono::milliseconds UploadScheduler::backoff_delay(std::chrono::milliseconds base,
                                                         std::uint32_t failed_attempt) noexcept {
    if (failed_attempt == 0) {
        return base;
    }
    const std::uint32_t shift = std::min<std::uint32_t>(failed_attempt - 1, 30);
    return base * (std::int64_t{1} << shift);
}

} // namespace relay::upload
