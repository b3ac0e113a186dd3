#include "relay/events/progress.hpp"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <sstream>

namespace relay::events {

std::string render_progress(const ProgressEvent& event) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    switch (event.stage) {
        case ProgressStage::Started:
            oss << "Uploading " << event.total_parts << " parts ("
                << static_cast<double>(event.total_bytes) / 1024.0 << " KB)";
            break;
        case ProgressStage::PartAcknowledged: {
            const double total = event.total_bytes == 0 ? 1.0 : static_cast<double>(event.total_bytes);
            const double percent = static_cast<double>(event.bytes_done) / total * 100.0;
            oss << "Uploading...\n"
                << "Progress: " << percent << "%\n"
                << static_cast<double>(event.bytes_done) / 1024.0 << " KB of "
                << static_cast<double>(event.total_bytes) / 1024.0 << " KB";
            break;
        }
        case ProgressStage::PartRetrying:
            oss << "Retrying part: " << event.message;
            break;
        case ProgressStage::Completed:
            oss << "Upload complete!";
            break;
        case ProgressStage::Failed:
            oss << "Upload failed: " << event.message;
            break;
    }
    return oss.str();
}

ProgressReporter::ProgressReporter(ProgressChannel& channel, Sink sink)
    : channel_(channel),
      sink_(std::move(sink)),
      worker_([this] { run(); }) {}

ProgressReporter::~ProgressReporter() {
    stop();
}

void ProgressReporter::stop() {
    channel_.shutdown();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void ProgressReporter::run() {
    while (auto event = channel_.pop()) {
        const auto text = render_progress(*event);
        try {
            sink_(*event, text);
        } catch (const std::exception& e) {
            spdlog::error("progress sink failed for file {}: {}", event->file_id, e.what());
        }
    }
}

} // namespace relay::events
