#pragma once

#include "relay/core/errors.hpp"
#include "relay/core/result.hpp"
#include "relay/upload/transport.hpp"
#include "relay/upload/types.hpp"

#include <boost/asio/thread_pool.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <set>
#include <unordered_map>

namespace relay::upload {

/**
 * @brief PartTransport that lands parts in a local staging directory
 *
 * Parts are written at index * part_size into <root>/<file_id>.part on an
 * internal thread pool, the way the platform would store them server-side.
 * assemble() then plays the platform's role when a reference is attached:
 * it checks the part count, verifies the MD5 of small-protocol files and
 * moves the result into place.
 */
class StagingTransport : public PartTransport {
public:
    StagingTransport(std::filesystem::path staging_root, std::size_t part_size, std::size_t threads = 2);
    ~StagingTransport() override;

    StagingTransport(const StagingTransport&) = delete;
    StagingTransport& operator=(const StagingTransport&) = delete;

    void save_file_part(PartRequest request, TransportCallback done) override;
    void save_big_file_part(PartRequest request, TransportCallback done) override;

    Result<std::filesystem::path, UploadError> assemble(const FileReference& reference,
                                                        const std::filesystem::path& destination_root);

    /// assemble() for multi-part files, plain copy for inline ones.
    Result<std::filesystem::path, UploadError> deliver(const MediaAttachment& attachment,
                                                       const std::filesystem::path& destination_root);

    [[nodiscard]] std::size_t parts_received(FileId file_id) const;

private:
    struct StagedFile {
        UploadProtocol protocol = UploadProtocol::Small;
        std::uint32_t total_parts = 0;
        std::set<std::uint32_t> received;
    };

    void enqueue(UploadProtocol protocol, PartRequest request, TransportCallback done);

    TransportStatus store_part(UploadProtocol protocol, const PartRequest& request);

    std::filesystem::path staging_path(FileId file_id) const;

    static Result<void, UploadError> ensure_parent_exists(const std::filesystem::path& path);

    std::filesystem::path staging_root_;
    std::size_t part_size_;
    boost::asio::thread_pool pool_;

    mutable std::mutex mutex_;
    std::unordered_map<FileId, StagedFile> files_;
};

} // namespace relay::upload
