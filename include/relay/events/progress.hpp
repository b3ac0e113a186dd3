#pragma once

#include "relay/events/bounded_queue.hpp"
#include "relay/upload/types.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <thread>

namespace relay::events {

enum class ProgressStage {
    Started,
    PartAcknowledged,
    PartRetrying,
    Completed,
    Failed
};

struct ProgressEvent {
    upload::FileId file_id = 0;
    ProgressStage stage = ProgressStage::Started;
    std::uint32_t parts_done = 0;
    std::uint32_t total_parts = 0;
    std::uint64_t bytes_done = 0;
    std::uint64_t total_bytes = 0;
    std::string message;

    [[nodiscard]] bool is_terminal() const noexcept {
        return stage == ProgressStage::Completed || stage == ProgressStage::Failed;
    }
};

using ProgressChannel = BoundedQueue<ProgressEvent>;

/// Status-message text for one event.
std::string render_progress(const ProgressEvent& event);

/**
 * @brief Single consumer of a ProgressChannel
 *
 * Owns one thread that pops events and hands the rendered text to the
 * sink, one call at a time. The sink is the only code that edits the
 * user's status message.
 */
class ProgressReporter {
public:
    using Sink = std::function<void(const ProgressEvent& event, const std::string& text)>;

    ProgressReporter(ProgressChannel& channel, Sink sink);
    ~ProgressReporter();

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    /// Shut the channel down and wait for the consumer to drain it.
    void stop();

private:
    void run();

    ProgressChannel& channel_;
    Sink sink_;
    std::thread worker_;
};

} // namespace relay::events
