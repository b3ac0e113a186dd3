#include "relay/upload/file_reference.hpp"

namespace relay::upload {

Result<FileReference, UploadError> build_file_reference(const UploadPlan& plan,
                                                        FileId file_id,
                                                        const std::string& display_name,
                                                        const std::optional<std::string>& digest) {
    if (plan.total_parts == 0) {
        return Err(UploadError(UploadErrorKind::RejectedPlan, "plan has no parts"));
    }

    if (plan.protocol == UploadProtocol::Big) {
        return Ok(FileReference{BigFileReference{file_id, plan.total_parts, display_name}});
    }

    if (!digest || digest->empty()) {
        return Err(UploadError(UploadErrorKind::RejectedPlan, "small-file reference requires a checksum"));
    }
    return Ok(FileReference{SmallFileReference{file_id, plan.total_parts, display_name, *digest}});
}

FileId file_id_of(const FileReference& reference) noexcept {
    return std::visit([](const auto& ref) { return ref.file_id; }, reference);
}

std::uint32_t part_count_of(const FileReference& reference) noexcept {
    return std::visit([](const auto& ref) { return ref.parts; }, reference);
}

const std::string& name_of(const FileReference& reference) noexcept {
    return std::visit([](const auto& ref) -> const std::string& { return ref.name; }, reference);
}

std::optional<std::string> checksum_of(const FileReference& reference) {
    if (const auto* small = std::get_if<SmallFileReference>(&reference)) {
        return small->md5_checksum;
    }
    return std::nullopt;
}

UploadProtocol protocol_of(const FileReference& reference) noexcept {
    return std::holds_alternative<BigFileReference>(reference) ? UploadProtocol::Big : UploadProtocol::Small;
}

} // namespace relay::upload
