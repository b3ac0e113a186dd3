#include "relay/upload/protocol_selector.hpp"

#include <limits>

namespace relay::upload {

ProtocolSelector::ProtocolSelector(std::size_t part_size, std::uint64_t big_file_threshold, PartLimits limits)
    : part_size_(part_size),
      big_file_threshold_(big_file_threshold),
      limits_(limits) {}

ProtocolSelector::ProtocolSelector(const UploadConfig& config)
    : ProtocolSelector(config.part_size, config.big_file_threshold, config.part_limits()) {}

std::uint32_t ProtocolSelector::parts_for(std::uint64_t file_size, std::size_t part_size) noexcept {
    if (part_size == 0) {
        return 0;
    }
    const std::uint64_t parts = (file_size + part_size - 1) / part_size;
    if (parts > std::numeric_limits<std::uint32_t>::max()) {
        return std::numeric_limits<std::uint32_t>::max();
    }
    return static_cast<std::uint32_t>(parts);
}

Result<UploadPlan, UploadError> ProtocolSelector::select(std::uint64_t file_size, AccountTier tier) const {
    if (part_size_ == 0) {
        return Err(UploadError(UploadErrorKind::RejectedPlan, "part size is zero"));
    }
    if (file_size == 0) {
        return Err(UploadError(UploadErrorKind::RejectedPlan, "file is empty"));
    }

    UploadPlan plan;
    plan.file_size = file_size;
    plan.part_size = part_size_;
    plan.total_parts = parts_for(file_size, part_size_);
    plan.tier = tier;
    plan.part_limit = limits_.limit_for(tier);

    if (plan.total_parts > plan.part_limit) {
        return Err(UploadError(UploadErrorKind::PartLimitExceeded,
                               std::to_string(plan.total_parts) + " parts exceed the " +
                               to_string(tier) + " limit of " + std::to_string(plan.part_limit)));
    }

    const auto transferred = static_cast<std::uint64_t>(plan.total_parts) * part_size_;
    plan.protocol = transferred > big_file_threshold_ ? UploadProtocol::Big : UploadProtocol::Small;
    plan.requires_checksum = plan.protocol == UploadProtocol::Small;
    return Ok(plan);
}

} // namespace relay::upload
