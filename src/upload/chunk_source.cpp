#include "relay/upload/chunk_source.hpp"

#include "relay/upload/protocol_selector.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace relay::upload {
namespace fs = std::filesystem;

Result<std::shared_ptr<ChunkSource>, UploadError> ChunkSource::open(const fs::path& path, std::size_t part_size) {
    if (part_size == 0) {
        return Err(UploadError(UploadErrorKind::RejectedPlan, "part size is zero"));
    }

    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return Err(UploadError(UploadErrorKind::Io,
                               "Failed to open " + path.string() + ": " + std::strerror(errno)));
    }

    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        const int err = errno;
        ::close(fd);
        return Err(UploadError(UploadErrorKind::Io,
                               "Failed to stat " + path.string() + ": " + std::strerror(err)));
    }
    if (!S_ISREG(st.st_mode)) {
        ::close(fd);
        return Err(UploadError(UploadErrorKind::Io, "Not a regular file: " + path.string()));
    }

    return Ok(std::shared_ptr<ChunkSource>(
        new ChunkSource(path, fd, static_cast<std::uint64_t>(st.st_size), part_size)));
}

ChunkSource::ChunkSource(fs::path path, int fd, std::uint64_t file_size, std::size_t part_size)
    : path_(std::move(path)),
      fd_(fd),
      file_size_(file_size),
      part_size_(part_size),
      total_parts_(ProtocolSelector::parts_for(file_size, part_size)) {}

ChunkSource::~ChunkSource() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

Result<Chunk, UploadError> ChunkSource::read(std::uint32_t index) const {
    if (index >= total_parts_) {
        return Err(UploadError(UploadErrorKind::EmptyChunk, "index past end of file").for_part(index));
    }

    const auto offset = static_cast<std::uint64_t>(index) * part_size_;
    const auto remaining = file_size_ - offset;
    const auto wanted = static_cast<std::size_t>(remaining < part_size_ ? remaining : part_size_);

    Chunk chunk;
    chunk.index = index;
    chunk.is_last = index + 1 == total_parts_;
    chunk.bytes.resize(wanted);

    std::size_t filled = 0;
    while (filled < wanted) {
        const ssize_t n = ::pread(fd_, chunk.bytes.data() + filled, wanted - filled,
                                  static_cast<off_t>(offset + filled));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Err(UploadError(UploadErrorKind::Io,
                                   "Failed to read " + path_.string() + ": " + std::strerror(errno))
                           .for_part(index));
        }
        if (n == 0) {
            break;
        }
        filled += static_cast<std::size_t>(n);
    }

    if (filled == 0) {
        return Err(UploadError(UploadErrorKind::EmptyChunk, "read returned no data").for_part(index));
    }
    // The file shrank since open: the chunk no longer matches the plan.
    if (filled != wanted) {
        return Err(UploadError(UploadErrorKind::Io, "file changed during upload: " + path_.string())
                       .for_part(index));
    }
    return Ok(std::move(chunk));
}

} // namespace relay::upload
