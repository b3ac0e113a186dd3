#include "relay/upload/service.hpp"

#include "relay/events/components.hpp"
#include "relay/upload/file_reference.hpp"
#include "relay/upload/staging_transport.hpp"

#include "../support/fake_transport.hpp"

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using relay::UploadConfig;
using relay::UploadErrorKind;
using relay::events::EventBus;
using relay::events::MetricsComponent;
using relay::events::ProgressChannel;
using relay::events::ProgressEvent;
using relay::events::ProgressReporter;
using relay::events::ProgressStage;
using relay::testing::FakeTransport;
using relay::upload::AccountTier;
using relay::upload::BigFileReference;
using relay::upload::ChecksumComputer;
using relay::upload::MediaKind;
using relay::upload::MediaUploadService;
using relay::upload::SmallFileReference;
using relay::upload::StagingTransport;
using relay::upload::UploadRequest;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("relay_service_test_" + std::to_string(id));
    fs::create_directories(dir);
    return dir;
}

std::string write_file(const fs::path& path, std::size_t size) {
    std::string content(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        content[i] = static_cast<char>('A' + (i * 7) % 53);
    }
    std::ofstream out(path, std::ios::binary);
    out << content;
    return content;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

// 1 KiB parts and a 10 KiB big-file threshold keep fixtures small.
UploadConfig small_config() {
    UploadConfig config;
    config.part_size = 1024;
    config.big_file_threshold = 10 * 1024;
    config.backoff_base = 10ms;
    config.upload_timeout = 10s;
    return config;
}

UploadRequest make_request(const fs::path& path, bool audio = false) {
    UploadRequest request;
    request.file_path = path;
    request.file_size = fs::file_size(path);
    request.display_name = path.filename().string();
    request.is_audio = audio;
    return request;
}

relay::upload::IdGenerator fixed_ids(relay::upload::FileId id, std::atomic<int>* draws = nullptr) {
    return [id, draws]() {
        if (draws != nullptr) {
            ++*draws;
        }
        return id;
    };
}

} // namespace

TEST(MediaUploadServiceTest, SmallFileEndToEnd) {
    const auto dir = create_temp_dir();
    const auto source = dir / "clip.mp4";
    const auto content = write_file(source, 5000);

    boost::asio::io_context io;
    EventBus bus;
    MetricsComponent metrics(bus);
    StagingTransport transport(dir / "staging", 1024);
    MediaUploadService service(io, transport, small_config(), bus, fixed_ids(99));

    auto result = service.upload(make_request(source));

    ASSERT_TRUE(result.is_ok()) << relay::describe(result.error());
    const auto& attachment = result.value();
    ASSERT_TRUE(std::holds_alternative<SmallFileReference>(attachment.reference));
    const auto& ref = std::get<SmallFileReference>(attachment.reference);
    EXPECT_EQ(ref.file_id, 99u);
    EXPECT_EQ(ref.parts, 5u);
    EXPECT_EQ(ref.name, "clip.mp4");
    EXPECT_EQ(ref.md5_checksum, ChecksumComputer{}.digest(source).value());
    EXPECT_EQ(attachment.kind, MediaKind::Video);
    EXPECT_EQ(attachment.caption, "Download complete");
    EXPECT_TRUE(attachment.supports_streaming);
    EXPECT_FALSE(attachment.inline_file.has_value());
    EXPECT_EQ(transport.parts_received(99), 5u);

    auto delivered = transport.deliver(attachment, dir / "out");
    ASSERT_TRUE(delivered.is_ok()) << delivered.error().message;
    EXPECT_EQ(read_file(delivered.value()), content);

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.uploads_started.load(), 1u);
    EXPECT_EQ(stats.uploads_completed.load(), 1u);
    EXPECT_EQ(stats.parts_acknowledged.load(), 5u);
    EXPECT_EQ(stats.bytes_uploaded.load(), 5000u);

    fs::remove_all(dir);
}

TEST(MediaUploadServiceTest, BigAudioFileHasNoChecksum) {
    const auto dir = create_temp_dir();
    const auto source = dir / "album.flac";
    const auto content = write_file(source, 20 * 1024 + 5);

    boost::asio::io_context io;
    EventBus bus;
    StagingTransport transport(dir / "staging", 1024);
    MediaUploadService service(io, transport, small_config(), bus, fixed_ids(7));

    auto result = service.upload(make_request(source, true));

    ASSERT_TRUE(result.is_ok()) << relay::describe(result.error());
    const auto& attachment = result.value();
    ASSERT_TRUE(std::holds_alternative<BigFileReference>(attachment.reference));
    EXPECT_EQ(relay::upload::part_count_of(attachment.reference), 21u);
    EXPECT_EQ(attachment.kind, MediaKind::Audio);
    EXPECT_EQ(attachment.title, "album.flac");
    EXPECT_FALSE(attachment.supports_streaming);

    auto delivered = transport.deliver(attachment, dir / "out");
    ASSERT_TRUE(delivered.is_ok()) << delivered.error().message;
    EXPECT_EQ(read_file(delivered.value()), content);

    fs::remove_all(dir);
}

TEST(MediaUploadServiceTest, SinglePartFileTravelsInline) {
    const auto dir = create_temp_dir();
    const auto source = dir / "tiny.ogg";
    write_file(source, 100);

    boost::asio::io_context io;
    EventBus bus;
    FakeTransport transport;
    MediaUploadService service(io, transport, small_config(), bus, fixed_ids(5));

    auto result = service.upload(make_request(source, true));

    ASSERT_TRUE(result.is_ok()) << relay::describe(result.error());
    EXPECT_EQ(transport.call_count(), 0u);
    ASSERT_TRUE(result.value().inline_file.has_value());
    EXPECT_EQ(*result.value().inline_file, source);
    EXPECT_TRUE(relay::upload::checksum_of(result.value().reference).has_value());

    fs::remove_all(dir);
}

TEST(MediaUploadServiceTest, FileAboveMaximumIsRejectedBeforeUpload) {
    const auto dir = create_temp_dir();
    const auto source = dir / "huge.mp4";
    write_file(source, 4096);

    auto config = small_config();
    config.max_file_size = 4095;

    boost::asio::io_context io;
    EventBus bus;
    MetricsComponent metrics(bus);
    FakeTransport transport;
    std::atomic<int> draws{0};
    MediaUploadService service(io, transport, config, bus, fixed_ids(1, &draws));

    relay::upload::FileId failed_id = 1;
    bus.subscribe<relay::events::UploadFailedEvent>([&](const relay::events::UploadFailedEvent& e) {
        failed_id = e.file_id;
    });

    auto result = service.upload(make_request(source));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, UploadErrorKind::FileTooLarge);
    EXPECT_EQ(relay::failure_reason(result.error()), relay::FailureReason::SizeExceeded);
    EXPECT_EQ(transport.call_count(), 0u);
    EXPECT_EQ(draws.load(), 0);
    EXPECT_EQ(failed_id, 0u);
    EXPECT_EQ(metrics.get_stats().uploads_failed.load(), 1u);

    fs::remove_all(dir);
}

TEST(MediaUploadServiceTest, PartLimitDependsOnTier) {
    const auto dir = create_temp_dir();
    const auto source = dir / "movie.mkv";
    write_file(source, 5 * 1024);

    auto config = small_config();
    config.regular_part_limit = 3;
    config.premium_part_limit = 8;

    boost::asio::io_context io;
    EventBus bus;
    FakeTransport transport;
    MediaUploadService service(io, transport, config, bus, fixed_ids(3));

    auto regular = service.upload(make_request(source));
    ASSERT_TRUE(regular.is_error());
    EXPECT_EQ(regular.error().kind, UploadErrorKind::PartLimitExceeded);
    EXPECT_EQ(transport.call_count(), 0u);

    auto request = make_request(source);
    request.tier = AccountTier::Premium;
    auto premium = service.upload(request);
    ASSERT_TRUE(premium.is_ok()) << relay::describe(premium.error());
    EXPECT_EQ(transport.call_count(), 5u);

    fs::remove_all(dir);
}

TEST(MediaUploadServiceTest, MissingOrChangedFileIsRejected) {
    const auto dir = create_temp_dir();

    boost::asio::io_context io;
    EventBus bus;
    FakeTransport transport;
    MediaUploadService service(io, transport, small_config(), bus, fixed_ids(3));

    UploadRequest missing;
    missing.file_path = dir / "missing.mp4";
    missing.file_size = 10;
    auto gone = service.upload(missing);
    ASSERT_TRUE(gone.is_error());
    EXPECT_EQ(gone.error().kind, UploadErrorKind::Io);

    const auto source = dir / "grown.mp4";
    write_file(source, 2048);
    auto request = make_request(source);
    request.file_size = 1000;
    auto changed = service.upload(request);
    ASSERT_TRUE(changed.is_error());
    EXPECT_EQ(changed.error().kind, UploadErrorKind::RejectedPlan);

    fs::remove_all(dir);
}

TEST(MediaUploadServiceTest, TransportFailureProducesNoReference) {
    const auto dir = create_temp_dir();
    const auto source = dir / "clip.mp4";
    write_file(source, 8 * 1024);

    boost::asio::io_context io;
    EventBus bus;
    MetricsComponent metrics(bus);
    FakeTransport transport;
    transport.fail_always(5);
    MediaUploadService service(io, transport, small_config(), bus, fixed_ids(11));

    auto result = service.upload(make_request(source));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, UploadErrorKind::TransportFailure);
    EXPECT_EQ(relay::failure_reason(result.error()), relay::FailureReason::UploadFailed);
    EXPECT_EQ(transport.calls_for(5).size(), 3u);
    EXPECT_EQ(metrics.get_stats().part_retries.load(), 2u);
    EXPECT_EQ(metrics.get_stats().uploads_completed.load(), 0u);

    fs::remove_all(dir);
}

TEST(MediaUploadServiceTest, RateLimitedPartReachesCaller) {
    const auto dir = create_temp_dir();
    const auto source = dir / "clip.mp4";
    write_file(source, 6 * 1024);

    boost::asio::io_context io;
    EventBus bus;
    MetricsComponent metrics(bus);
    FakeTransport transport;
    transport.script(2, {relay::upload::TransportStatus::rate_limited("FLOOD_WAIT_30", 30s)});
    MediaUploadService service(io, transport, small_config(), bus, fixed_ids(13));

    auto result = service.upload(make_request(source));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, UploadErrorKind::RateLimited);
    ASSERT_TRUE(result.error().retry_after.has_value());
    EXPECT_EQ(*result.error().retry_after, 30s);
    const auto reason = relay::failure_reason(result.error());
    EXPECT_EQ(reason, relay::FailureReason::RateLimited);
    EXPECT_STREQ(relay::user_message(reason), "Upload limit reached for this account, try again later");
    EXPECT_EQ(transport.calls_for(2).size(), 1u);
    EXPECT_EQ(metrics.get_stats().uploads_rate_limited.load(), 1u);
    EXPECT_EQ(metrics.get_stats().uploads_completed.load(), 0u);

    fs::remove_all(dir);
}

TEST(MediaUploadServiceTest, ConfiguredTimeoutStopsSlowUpload) {
    const auto dir = create_temp_dir();
    const auto source = dir / "clip.mp4";
    write_file(source, 4 * 1024);

    auto config = small_config();
    config.upload_timeout = 1s;

    boost::asio::io_context io;
    EventBus bus;
    MetricsComponent metrics(bus);
    FakeTransport transport;
    transport.set_latency(1, 2500ms);
    MediaUploadService service(io, transport, config, bus, fixed_ids(14));

    const auto started = std::chrono::steady_clock::now();
    auto result = service.upload(make_request(source));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, UploadErrorKind::TimedOut);
    EXPECT_EQ(relay::failure_reason(result.error()), relay::FailureReason::UploadFailed);
    EXPECT_LT(elapsed, 2500ms);
    EXPECT_EQ(metrics.get_stats().uploads_failed.load(), 1u);
    EXPECT_EQ(metrics.get_stats().uploads_completed.load(), 0u);

    fs::remove_all(dir);
}

TEST(MediaUploadServiceTest, ProgressEndsWithTerminalEvent) {
    const auto dir = create_temp_dir();
    const auto source = dir / "clip.mp4";
    write_file(source, 6 * 1024);

    boost::asio::io_context io;
    EventBus bus;
    FakeTransport transport;
    MediaUploadService service(io, transport, small_config(), bus, fixed_ids(12));

    ProgressChannel channel(64);
    std::mutex mutex;
    std::vector<ProgressEvent> seen;
    ProgressReporter reporter(channel, [&](const ProgressEvent& event, const std::string&) {
        std::lock_guard lock(mutex);
        seen.push_back(event);
    });
    service.set_progress_channel(&channel);

    auto result = service.upload(make_request(source));
    reporter.stop();

    ASSERT_TRUE(result.is_ok()) << relay::describe(result.error());
    ASSERT_EQ(seen.size(), 8u);
    EXPECT_EQ(seen.front().stage, ProgressStage::Started);
    EXPECT_EQ(seen.back().stage, ProgressStage::Completed);
    EXPECT_EQ(seen.back().bytes_done, 6u * 1024u);

    std::uint64_t last_bytes = 0;
    for (const auto& event : seen) {
        EXPECT_EQ(event.file_id, 12u);
        EXPECT_GE(event.bytes_done, last_bytes);
        last_bytes = event.bytes_done;
    }

    fs::remove_all(dir);
}
