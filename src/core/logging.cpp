#include "relay/core/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace relay::logging {

Result<void> init(const std::string& level, const std::string& log_file) {
    const auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        return Err(std::string("Unknown log level: ") + level);
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
        } catch (const spdlog::spdlog_ex& e) {
            return Err(std::string("Failed to open log file: ") + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("relay", sinks.begin(), sinks.end());
    logger->set_level(parsed);
    logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_default_logger(std::move(logger));
    return Ok();
}

} // namespace relay::logging
