#include "relay/upload/staging_transport.hpp"

#include "relay/upload/checksum.hpp"
#include "relay/upload/file_reference.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace relay::upload {
namespace fs = std::filesystem;

StagingTransport::StagingTransport(fs::path staging_root, std::size_t part_size, std::size_t threads)
    : staging_root_(std::move(staging_root)),
      part_size_(part_size),
      pool_(threads == 0 ? 1 : threads) {
    std::error_code ec;
    fs::create_directories(staging_root_, ec);
    if (ec) {
        spdlog::warn("Failed to create staging root {}: {}", staging_root_.string(), ec.message());
    }
}

StagingTransport::~StagingTransport() {
    pool_.join();
}

void StagingTransport::save_file_part(PartRequest request, TransportCallback done) {
    enqueue(UploadProtocol::Small, std::move(request), std::move(done));
}

void StagingTransport::save_big_file_part(PartRequest request, TransportCallback done) {
    enqueue(UploadProtocol::Big, std::move(request), std::move(done));
}

void StagingTransport::enqueue(UploadProtocol protocol, PartRequest request, TransportCallback done) {
    boost::asio::post(pool_, [this, protocol, request = std::move(request), done = std::move(done)]() {
        done(store_part(protocol, request));
    });
}

TransportStatus StagingTransport::store_part(UploadProtocol protocol, const PartRequest& request) {
    if (!request.bytes || request.bytes->empty()) {
        return TransportStatus::failed("FILE_PART_EMPTY");
    }
    if (request.bytes->size() > part_size_) {
        return TransportStatus::failed("FILE_PART_SIZE_INVALID");
    }
    if (request.part_index >= request.total_parts) {
        return TransportStatus::failed("FILE_PART_INVALID");
    }

    std::lock_guard lock(mutex_);

    auto [it, inserted] = files_.try_emplace(request.file_id);
    auto& staged = it->second;
    if (inserted) {
        staged.protocol = protocol;
        staged.total_parts = request.total_parts;
    } else if (staged.protocol != protocol || staged.total_parts != request.total_parts) {
        return TransportStatus::failed("FILE_PARTS_INVALID");
    }

    const auto path = staging_path(request.file_id);
    const auto offset = static_cast<std::streamoff>(request.part_index) * static_cast<std::streamoff>(part_size_);

    std::fstream file(path, std::ios::in | std::ios::out | std::ios::binary);
    if (!file) {
        std::ofstream create(path, std::ios::binary | std::ios::trunc);
        if (!create) {
            return TransportStatus::failed("Failed to create staging file: " + path.string());
        }
        create.close();
        file.open(path, std::ios::in | std::ios::out | std::ios::binary);
    }
    if (!file) {
        return TransportStatus::failed("Failed to open staging file: " + path.string());
    }

    file.seekp(offset);
    file.write(reinterpret_cast<const char*>(request.bytes->data()),
               static_cast<std::streamsize>(request.bytes->size()));
    file.flush();
    if (!file) {
        return TransportStatus::failed("Failed to write part " + std::to_string(request.part_index));
    }

    staged.received.insert(request.part_index);
    return TransportStatus::ok();
}

Result<fs::path, UploadError> StagingTransport::assemble(const FileReference& reference,
                                                         const fs::path& destination_root) {
    const auto file_id = file_id_of(reference);
    StagedFile staged;
    {
        std::lock_guard lock(mutex_);
        auto it = files_.find(file_id);
        if (it == files_.end()) {
            return Err(UploadError(UploadErrorKind::TransportFailure, "FILE_PARTS_MISSING"));
        }
        staged = it->second;
    }

    if (staged.protocol != protocol_of(reference)) {
        return Err(UploadError(UploadErrorKind::TransportFailure, "reference protocol does not match the parts"));
    }
    const auto parts = part_count_of(reference);
    if (staged.total_parts != parts || staged.received.size() != parts) {
        return Err(UploadError(UploadErrorKind::TransportFailure,
                               "FILE_PARTS_INVALID: " + std::to_string(staged.received.size()) + " of " +
                               std::to_string(parts) + " parts stored"));
    }

    const auto source = staging_path(file_id);
    if (const auto expected = checksum_of(reference)) {
        auto actual = ChecksumComputer{}.digest(source);
        if (actual.is_error()) {
            return Err(actual.error());
        }
        if (actual.value() != *expected) {
            return Err(UploadError(UploadErrorKind::TransportFailure, "MD5_CHECKSUM_INVALID"));
        }
    }

    const fs::path destination = destination_root / fs::path(name_of(reference)).filename();
    if (auto res = ensure_parent_exists(destination); res.is_error()) {
        return Err(res.error());
    }

    std::error_code ec;
    fs::rename(source, destination, ec);
    if (ec) {
        // Staging and destination may sit on different filesystems
        fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            return Err(UploadError(UploadErrorKind::Io, "Failed to move staging file: " + destination.string()));
        }
        fs::remove(source, ec);
    }

    {
        std::lock_guard lock(mutex_);
        files_.erase(file_id);
    }
    spdlog::debug("assembled file {} into {}", file_id, destination.string());
    return Ok(destination);
}

Result<fs::path, UploadError> StagingTransport::deliver(const MediaAttachment& attachment,
                                                        const fs::path& destination_root) {
    if (!attachment.inline_file) {
        return assemble(attachment.reference, destination_root);
    }

    const fs::path destination = destination_root / fs::path(name_of(attachment.reference)).filename();
    if (auto res = ensure_parent_exists(destination); res.is_error()) {
        return Err(res.error());
    }
    std::error_code ec;
    fs::copy_file(*attachment.inline_file, destination, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Err(UploadError(UploadErrorKind::Io, "Failed to copy inline file: " + ec.message()));
    }
    return Ok(destination);
}

std::size_t StagingTransport::parts_received(FileId file_id) const {
    std::lock_guard lock(mutex_);
    auto it = files_.find(file_id);
    return it == files_.end() ? 0 : it->second.received.size();
}

fs::path StagingTransport::staging_path(FileId file_id) const {
    return staging_root_ / (std::to_string(file_id) + ".part");
}

Result<void, UploadError> StagingTransport::ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::exists(parent)) {
        return Err(UploadError(UploadErrorKind::Io, "Failed to create directory: " + parent.string()));
    }
    return Ok();
}

} // namespace relay::upload
