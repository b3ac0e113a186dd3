#pragma once

#include "relay/core/errors.hpp"
#include "relay/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace relay::upload {

/**
 * @brief Whole-file MD5 for the small-file protocol
 *
 * Streams the file in fixed 4 KiB reads so memory use does not depend on
 * the file size. Digests are lowercase hex.
 */
class ChecksumComputer {
public:
    static constexpr std::size_t kReadBlockSize = 4096;

    Result<std::string, UploadError> digest(const std::filesystem::path& path) const;

    Result<std::string, UploadError> digest(const std::uint8_t* data, std::size_t length) const;
};

} // namespace relay::upload
