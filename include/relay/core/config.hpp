#pragma once

#include "relay/core/result.hpp"
#include "relay/upload/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace relay {

/**
 * @brief Tunables of the upload engine
 *
 * Defaults match the platform limits the engine was written against.
 * Values come from a JSON file and RELAY_* environment overrides.
 */
struct UploadConfig {
    std::size_t part_size = 512 * 1024;
    std::uint64_t big_file_threshold = 10 * 1024 * 1024;
    std::size_t max_concurrent_parts = 4;
    std::uint32_t max_retries = 3;
    std::chrono::milliseconds backoff_base{1000};
    std::uint32_t regular_part_limit = 2000;
    std::uint32_t premium_part_limit = 4000;
    std::uint64_t max_file_size = 2ULL * 1024 * 1024 * 1024;
    std::chrono::seconds upload_timeout{1000};
    std::size_t progress_queue_capacity = 64;
    upload::AccountTier default_tier = upload::AccountTier::Regular;
    upload::FailurePolicy failure_policy = upload::FailurePolicy::FailFast;
    std::string log_level = "info";
    std::string log_file;

    [[nodiscard]] upload::PartLimits part_limits() const noexcept {
        return upload::PartLimits{regular_part_limit, premium_part_limit};
    }
};

Result<void> validate(const UploadConfig& config);

/// Parse a JSON document; keys absent from the document keep their defaults.
Result<UploadConfig> config_from_json(const std::string& text);

Result<UploadConfig> load_config(const std::filesystem::path& path);

/// Apply RELAY_PART_SIZE, RELAY_MAX_RETRIES, ... on top of @p config.
Result<void> apply_env_overrides(UploadConfig& config);

} // namespace relay
