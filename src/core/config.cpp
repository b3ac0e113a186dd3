#include "relay/core/config.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdlib>
#include <functional>
#include <fstream>
#include <sstream>

namespace relay {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr std::size_t kMaxPartSize = 512 * 1024;

Result<std::uint64_t> parse_unsigned(const char* name, const std::string& text) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
        return Err(std::string(name) + " is not an unsigned integer: " + text);
    }
    try {
        std::size_t consumed = 0;
        const auto value = std::stoull(text, &consumed);
        if (consumed != text.size()) {
            return Err(std::string(name) + " is not an unsigned integer: " + text);
        }
        return Ok(static_cast<std::uint64_t>(value));
    } catch (const std::exception&) {
        return Err(std::string(name) + " is not an unsigned integer: " + text);
    }
}

constexpr const char* kNumericKeys[] = {
    "part_size", "big_file_threshold", "max_concurrent_parts", "max_retries",
    "backoff_base_ms", "regular_part_limit", "premium_part_limit", "max_file_size",
    "upload_timeout_s", "progress_queue_capacity",
};

// Numeric keys are unsigned; a negative value would wrap on conversion.
Result<void> check_numeric_keys(const json& doc) {
    for (const char* key : kNumericKeys) {
        auto it = doc.find(key);
        if (it != doc.end() && !it->is_number_unsigned()) {
            return Err(std::string(key) + " must be a non-negative integer");
        }
    }
    return Ok();
}

} // namespace

Result<void> validate(const UploadConfig& config) {
    if (config.part_size == 0 || config.part_size % 1024 != 0) {
        return Err(std::string("part_size must be a positive multiple of 1024"));
    }
    if (config.part_size > kMaxPartSize || kMaxPartSize % config.part_size != 0) {
        return Err(std::string("part_size must divide 524288"));
    }
    if (config.big_file_threshold == 0) {
        return Err(std::string("big_file_threshold must be > 0"));
    }
    if (config.max_concurrent_parts == 0) {
        return Err(std::string("max_concurrent_parts must be > 0"));
    }
    if (config.max_retries == 0) {
        return Err(std::string("max_retries must be > 0"));
    }
    if (config.backoff_base.count() < 0) {
        return Err(std::string("backoff_base_ms must not be negative"));
    }
    if (config.upload_timeout.count() < 0) {
        return Err(std::string("upload_timeout_s must not be negative"));
    }
    if (config.regular_part_limit == 0) {
        return Err(std::string("regular_part_limit must be > 0"));
    }
    if (config.premium_part_limit < config.regular_part_limit) {
        return Err(std::string("premium_part_limit must be >= regular_part_limit"));
    }
    if (config.max_file_size == 0) {
        return Err(std::string("max_file_size must be > 0"));
    }
    if (config.progress_queue_capacity == 0) {
        return Err(std::string("progress_queue_capacity must be > 0"));
    }
    return Ok();
}

Result<UploadConfig> config_from_json(const std::string& text) {
    auto doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        return Err(std::string("Invalid JSON"));
    }
    if (!doc.is_object()) {
        return Err(std::string("Configuration must be a JSON object"));
    }

    if (auto res = check_numeric_keys(doc); res.is_error()) {
        return Err(res.error());
    }

    UploadConfig config;
    try {
        config.part_size = doc.value("part_size", config.part_size);
        config.big_file_threshold = doc.value("big_file_threshold", config.big_file_threshold);
        config.max_concurrent_parts = doc.value("max_concurrent_parts", config.max_concurrent_parts);
        config.max_retries = doc.value("max_retries", config.max_retries);
        config.backoff_base = std::chrono::milliseconds(
            doc.value("backoff_base_ms", static_cast<std::int64_t>(config.backoff_base.count())));
        config.regular_part_limit = doc.value("regular_part_limit", config.regular_part_limit);
        config.premium_part_limit = doc.value("premium_part_limit", config.premium_part_limit);
        config.max_file_size = doc.value("max_file_size", config.max_file_size);
        config.upload_timeout = std::chrono::seconds(
            doc.value("upload_timeout_s", static_cast<std::int64_t>(config.upload_timeout.count())));
        config.progress_queue_capacity = doc.value("progress_queue_capacity", config.progress_queue_capacity);
        config.log_level = doc.value("log_level", config.log_level);
        config.log_file = doc.value("log_file", config.log_file);

        if (doc.contains("account_tier")) {
            const auto tier = upload::parse_account_tier(doc.at("account_tier").get<std::string>());
            if (!tier) {
                return Err(std::string("Unknown account_tier"));
            }
            config.default_tier = *tier;
        }
        if (doc.contains("failure_policy")) {
            const auto policy = upload::parse_failure_policy(doc.at("failure_policy").get<std::string>());
            if (!policy) {
                return Err(std::string("Unknown failure_policy"));
            }
            config.failure_policy = *policy;
        }
    } catch (const json::exception& e) {
        return Err(std::string("Invalid configuration value: ") + e.what());
    }

    if (auto res = validate(config); res.is_error()) {
        return Err(res.error());
    }
    return Ok(std::move(config));
}

Result<UploadConfig> load_config(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err(std::string("Failed to open config file: ") + path.string());
    }
    std::ostringstream oss;
    oss << input.rdbuf();
    return config_from_json(oss.str());
}

Result<void> apply_env_overrides(UploadConfig& config) {
    struct NumericOverride {
        const char* name;
        std::function<void(std::uint64_t)> apply;
    };

    const NumericOverride numeric[] = {
        {"RELAY_PART_SIZE", [&](std::uint64_t v) { config.part_size = static_cast<std::size_t>(v); }},
        {"RELAY_BIG_FILE_THRESHOLD", [&](std::uint64_t v) { config.big_file_threshold = v; }},
        {"RELAY_MAX_CONCURRENT_PARTS", [&](std::uint64_t v) { config.max_concurrent_parts = static_cast<std::size_t>(v); }},
        {"RELAY_MAX_RETRIES", [&](std::uint64_t v) { config.max_retries = static_cast<std::uint32_t>(v); }},
        {"RELAY_BACKOFF_BASE_MS", [&](std::uint64_t v) { config.backoff_base = std::chrono::milliseconds(v); }},
        {"RELAY_REGULAR_PART_LIMIT", [&](std::uint64_t v) { config.regular_part_limit = static_cast<std::uint32_t>(v); }},
        {"RELAY_PREMIUM_PART_LIMIT", [&](std::uint64_t v) { config.premium_part_limit = static_cast<std::uint32_t>(v); }},
        {"RELAY_MAX_FILE_SIZE", [&](std::uint64_t v) { config.max_file_size = v; }},
        {"RELAY_UPLOAD_TIMEOUT_S", [&](std::uint64_t v) { config.upload_timeout = std::chrono::seconds(v); }},
        {"RELAY_PROGRESS_QUEUE_CAPACITY", [&](std::uint64_t v) { config.progress_queue_capacity = static_cast<std::size_t>(v); }},
    };

    for (const auto& entry : numeric) {
        const char* raw = std::getenv(entry.name);
        if (raw == nullptr || *raw == '\0') {
            continue;
        }
        auto parsed = parse_unsigned(entry.name, raw);
        if (parsed.is_error()) {
            return Err(parsed.error());
        }
        entry.apply(parsed.value());
    }

    if (const char* raw = std::getenv("RELAY_ACCOUNT_TIER"); raw != nullptr && *raw != '\0') {
        const auto tier = upload::parse_account_tier(raw);
        if (!tier) {
            return Err(std::string("Unknown RELAY_ACCOUNT_TIER: ") + raw);
        }
        config.default_tier = *tier;
    }
    if (const char* raw = std::getenv("RELAY_FAILURE_POLICY"); raw != nullptr && *raw != '\0') {
        const auto policy = upload::parse_failure_policy(raw);
        if (!policy) {
            return Err(std::string("Unknown RELAY_FAILURE_POLICY: ") + raw);
        }
        config.failure_policy = *policy;
    }
    if (const char* raw = std::getenv("RELAY_LOG_LEVEL"); raw != nullptr && *raw != '\0') {
        config.log_level = raw;
    }
    if (const char* raw = std::getenv("RELAY_LOG_FILE"); raw != nullptr) {
        config.log_file = raw;
    }

    return validate(config);
}

} // namespace relay
