#include "relay/core/config.hpp"
#include "relay/core/errors.hpp"
#include "relay/core/logging.hpp"
#include "relay/events/components.hpp"
#include "relay/events/event_bus.hpp"
#include "relay/events/progress.hpp"
#include "relay/upload/file_reference.hpp"
#include "relay/upload/service.hpp"
#include "relay/upload/staging_transport.hpp"

#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <variant>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

struct Options {
    fs::path file;
    std::string name;
    bool audio = false;
    std::optional<relay::upload::AccountTier> tier;
    std::optional<fs::path> config;
    fs::path staging = fs::temp_directory_path() / "relay-staging";
    fs::path output = "relay-output";
    std::optional<std::string> log_level;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " --file <path> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --file <path>         File to upload (required)\n";
    std::cout << "  --name <text>         Display name (default: file name)\n";
    std::cout << "  --audio               Attach as audio instead of video\n";
    std::cout << "  --premium             Use the premium part limit\n";
    std::cout << "  --tier <regular|premium>\n";
    std::cout << "  --config <path>       JSON configuration file\n";
    std::cout << "  --staging <dir>       Where parts are staged\n";
    std::cout << "  --output <dir>        Where the assembled file is delivered\n";
    std::cout << "  --log-level <level>   trace, debug, info, warn, error\n";
    std::cout << "  --help                Show this message\n";
}

json reference_to_json(const relay::upload::FileReference& reference) {
    json j;
    j["file_id"] = relay::upload::file_id_of(reference);
    j["parts"] = relay::upload::part_count_of(reference);
    j["name"] = relay::upload::name_of(reference);
    j["protocol"] = relay::upload::to_string(relay::upload::protocol_of(reference));
    if (const auto checksum = relay::upload::checksum_of(reference)) {
        j["md5_checksum"] = *checksum;
    }
    return j;
}

json attachment_to_json(const relay::upload::MediaAttachment& attachment) {
    json j;
    j["reference"] = reference_to_json(attachment.reference);
    j["kind"] = attachment.kind == relay::upload::MediaKind::Audio ? "audio" : "video";
    if (!attachment.title.empty()) {
        j["title"] = attachment.title;
    }
    if (!attachment.caption.empty()) {
        j["caption"] = attachment.caption;
    }
    j["supports_streaming"] = attachment.supports_streaming;
    if (attachment.inline_file) {
        j["inline_file"] = attachment.inline_file->string();
    }
    return j;
}

// Returns nullopt after printing usage or an error; exit_code says which.
std::optional<Options> parse_args(int argc, char* argv[], int& exit_code) {
    Options options;
    exit_code = 1;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const auto next = [&](const char* flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << flag << " requires a value\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            exit_code = 0;
            return std::nullopt;
        } else if (arg == "--file") {
            auto value = next("--file");
            if (!value) return std::nullopt;
            options.file = *value;
        } else if (arg == "--name") {
            auto value = next("--name");
            if (!value) return std::nullopt;
            options.name = *value;
        } else if (arg == "--audio") {
            options.audio = true;
        } else if (arg == "--premium") {
            options.tier = relay::upload::AccountTier::Premium;
        } else if (arg == "--tier") {
            auto value = next("--tier");
            if (!value) return std::nullopt;
            options.tier = relay::upload::parse_account_tier(*value);
            if (!options.tier) {
                std::cerr << "Invalid tier: " << *value << "\n";
                return std::nullopt;
            }
        } else if (arg == "--config") {
            auto value = next("--config");
            if (!value) return std::nullopt;
            options.config = fs::path(*value);
        } else if (arg == "--staging") {
            auto value = next("--staging");
            if (!value) return std::nullopt;
            options.staging = *value;
        } else if (arg == "--output") {
            auto value = next("--output");
            if (!value) return std::nullopt;
            options.output = *value;
        } else if (arg == "--log-level") {
            auto value = next("--log-level");
            if (!value) return std::nullopt;
            options.log_level = *value;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return std::nullopt;
        }
    }

    if (options.file.empty()) {
        std::cerr << "--file is required\n";
        print_usage(argv[0]);
        return std::nullopt;
    }
    if (options.name.empty()) {
        options.name = options.file.filename().string();
    }
    return options;
}

} // namespace

int main(int argc, char* argv[]) {
    int exit_code = 0;
    auto parsed = parse_args(argc, argv, exit_code);
    if (!parsed) {
        return exit_code;
    }
    const Options& options = *parsed;

    relay::UploadConfig config;
    if (options.config) {
        auto loaded = relay::load_config(*options.config);
        if (loaded.is_error()) {
            std::cerr << "Invalid configuration: " << loaded.error() << "\n";
            return 1;
        }
        config = loaded.value();
    }
    if (auto env = relay::apply_env_overrides(config); env.is_error()) {
        std::cerr << "Invalid environment override: " << env.error() << "\n";
        return 1;
    }
    if (options.log_level) {
        config.log_level = *options.log_level;
    }
    if (auto logging = relay::logging::init(config.log_level, config.log_file); logging.is_error()) {
        std::cerr << logging.error() << "\n";
        return 1;
    }

    std::error_code ec;
    const auto file_size = fs::file_size(options.file, ec);
    if (ec) {
        spdlog::error("Cannot stat {}: {}", options.file.string(), ec.message());
        return 1;
    }

    relay::events::EventBus bus;
    relay::events::LoggerComponent logger(bus);
    relay::events::MetricsComponent metrics(bus);

    relay::events::ProgressChannel progress(config.progress_queue_capacity);
    relay::events::ProgressReporter reporter(progress,
        [](const relay::events::ProgressEvent&, const std::string& text) {
            std::cout << text << "\n" << std::flush;
        });

    boost::asio::io_context io;
    relay::upload::StagingTransport transport(options.staging, config.part_size);
    relay::upload::MediaUploadService service(io, transport, config, bus);
    service.set_progress_channel(&progress);

    relay::upload::UploadRequest request;
    request.file_path = options.file;
    request.file_size = file_size;
    request.display_name = options.name;
    request.is_audio = options.audio;
    request.tier = options.tier.value_or(config.default_tier);

    auto result = service.upload(std::move(request));
    reporter.stop();

    if (result.is_error()) {
        const auto& error = result.error();
        spdlog::error("{}", relay::describe(error));
        std::cerr << relay::user_message(relay::failure_reason(error)) << "\n";
        metrics.print_stats();
        return 2;
    }

    const auto& attachment = result.value();
    auto delivered = transport.deliver(attachment, options.output);
    if (delivered.is_error()) {
        spdlog::error("Delivery failed: {}", relay::describe(delivered.error()));
        metrics.print_stats();
        return 3;
    }

    json out = attachment_to_json(attachment);
    out["delivered_to"] = delivered.value().string();
    std::cout << out.dump(2) << "\n";

    metrics.print_stats();
    return 0;
}
