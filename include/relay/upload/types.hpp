#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace relay::upload {

using FileId = std::uint64_t;
using Bytes = std::vector<std::uint8_t>;
using SharedBytes = std::shared_ptr<const Bytes>;

enum class AccountTier {
    Regular,
    Premium
};

/**
 * @brief Wire procedure used to assemble parts server-side
 */
enum class UploadProtocol {
    Small,  ///< saveFilePart, whole-file MD5 in the reference
    Big     ///< saveBigFilePart, no checksum field
};

enum class FailurePolicy {
    FailFast,   ///< Stop admitting parts after the first permanent failure
    CollectAll  ///< Run every part, then report all failed indices
};

enum class MediaKind {
    Audio,
    Video
};

/**
 * @brief Maximum part count per account tier
 */
struct PartLimits {
    std::uint32_t regular = 2000;
    std::uint32_t premium = 4000;

    [[nodiscard]] std::uint32_t limit_for(AccountTier tier) const noexcept {
        return tier == AccountTier::Premium ? premium : regular;
    }
};

/**
 * @brief Immutable decision for one upload attempt
 */
struct UploadPlan {
    std::uint64_t file_size = 0;
    std::size_t part_size = 0;
    std::uint32_t total_parts = 0;
    UploadProtocol protocol = UploadProtocol::Small;
    AccountTier tier = AccountTier::Regular;
    bool requires_checksum = true;
    std::uint32_t part_limit = 0;

    [[nodiscard]] bool is_last(std::uint32_t index) const noexcept {
        return index + 1 == total_parts;
    }

    /// Byte length a correct chunk at @p index must have.
    [[nodiscard]] std::size_t expected_length(std::uint32_t index) const noexcept {
        if (!is_last(index)) {
            return part_size;
        }
        const auto consumed = static_cast<std::uint64_t>(index) * part_size;
        return static_cast<std::size_t>(file_size - consumed);
    }
};

struct Chunk {
    std::uint32_t index = 0;
    Bytes bytes;
    bool is_last = false;
};

/**
 * @brief Acknowledgement of one part
 */
struct PartAck {
    FileId file_id = 0;
    std::uint32_t part_index = 0;
    std::size_t bytes = 0;
    bool transferred = true;  ///< false when no network call was needed
};

struct SmallFileReference {
    FileId file_id = 0;
    std::uint32_t parts = 0;
    std::string name;
    std::string md5_checksum;
};

struct BigFileReference {
    FileId file_id = 0;
    std::uint32_t parts = 0;
    std::string name;
};

using FileReference = std::variant<SmallFileReference, BigFileReference>;

/**
 * @brief Input handed over by the download/extraction layer
 */
struct UploadRequest {
    std::filesystem::path file_path;
    std::uint64_t file_size = 0;
    std::string display_name;
    bool is_audio = false;
    AccountTier tier = AccountTier::Regular;
};

/**
 * @brief What the message-send layer attaches to one outbound message
 */
struct MediaAttachment {
    FileReference reference;
    MediaKind kind = MediaKind::Video;
    std::string title;
    std::string caption;
    bool supports_streaming = false;
    std::optional<std::filesystem::path> inline_file;  ///< Single-part files travel with the message
};

const char* to_string(AccountTier tier) noexcept;
const char* to_string(UploadProtocol protocol) noexcept;
const char* to_string(FailurePolicy policy) noexcept;

std::optional<AccountTier> parse_account_tier(const std::string& text);
std::optional<FailurePolicy> parse_failure_policy(const std::string& text);

} // namespace relay::upload
