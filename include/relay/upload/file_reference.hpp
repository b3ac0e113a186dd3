#pragma once

#include "relay/core/errors.hpp"
#include "relay/core/result.hpp"
#include "relay/upload/types.hpp"

#include <optional>
#include <string>

namespace relay::upload {

/**
 * @brief Assemble the reference for a fully acknowledged upload
 *
 * Small plans need the MD5 digest and produce a SmallFileReference. Big
 * plans produce a BigFileReference and ignore any digest passed in.
 */
Result<FileReference, UploadError> build_file_reference(const UploadPlan& plan,
                                                        FileId file_id,
                                                        const std::string& display_name,
                                                        const std::optional<std::string>& digest);

FileId file_id_of(const FileReference& reference) noexcept;
std::uint32_t part_count_of(const FileReference& reference) noexcept;
const std::string& name_of(const FileReference& reference) noexcept;
std::optional<std::string> checksum_of(const FileReference& reference);
UploadProtocol protocol_of(const FileReference& reference) noexcept;

} // namespace relay::upload
