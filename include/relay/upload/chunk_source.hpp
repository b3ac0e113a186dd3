#pragma once

#include "relay/core/errors.hpp"
#include "relay/core/result.hpp"
#include "relay/upload/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>

namespace relay::upload {

/**
 * @brief Read-only, index-addressed view of a file split into parts
 *
 * Every read is an independent positioned read on one descriptor, so
 * concurrent callers need no locking. Chunks are materialised on demand and
 * owned by the caller.
 */
class ChunkSource {
public:
    static Result<std::shared_ptr<ChunkSource>, UploadError> open(const std::filesystem::path& path,
                                                                  std::size_t part_size);

    ~ChunkSource();

    ChunkSource(const ChunkSource&) = delete;
    ChunkSource& operator=(const ChunkSource&) = delete;

    /**
     * @brief Read the chunk at @p index
     *
     * Fails with EmptyChunk when the index is past the end or the file
     * shrank underneath us; a chunk is never returned empty.
     */
    Result<Chunk, UploadError> read(std::uint32_t index) const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t file_size() const noexcept { return file_size_; }
    [[nodiscard]] std::size_t part_size() const noexcept { return part_size_; }
    [[nodiscard]] std::uint32_t total_parts() const noexcept { return total_parts_; }

private:
    ChunkSource(std::filesystem::path path, int fd, std::uint64_t file_size, std::size_t part_size);

    std::filesystem::path path_;
    int fd_ = -1;
    std::uint64_t file_size_ = 0;
    std::size_t part_size_ = 0;
    std::uint32_t total_parts_ = 0;
};

} // namespace relay::upload
