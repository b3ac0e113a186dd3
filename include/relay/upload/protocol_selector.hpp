#pragma once

#include "relay/core/config.hpp"
#include "relay/core/errors.hpp"
#include "relay/core/result.hpp"
#include "relay/upload/types.hpp"

#include <cstddef>
#include <cstdint>

namespace relay::upload {

/**
 * @brief Turns (file size, account tier) into an UploadPlan
 *
 * The big-file decision is made on the transferred volume
 * (total_parts * part_size), not on the raw file size, so a file just under
 * the threshold whose last part is rounded up still goes through the big
 * protocol.
 */
class ProtocolSelector {
public:
    ProtocolSelector(std::size_t part_size, std::uint64_t big_file_threshold, PartLimits limits);

    explicit ProtocolSelector(const UploadConfig& config);

    Result<UploadPlan, UploadError> select(std::uint64_t file_size, AccountTier tier) const;

    [[nodiscard]] static std::uint32_t parts_for(std::uint64_t file_size, std::size_t part_size) noexcept;

    [[nodiscard]] std::size_t part_size() const noexcept { return part_size_; }
    [[nodiscard]] std::uint64_t big_file_threshold() const noexcept { return big_file_threshold_; }
    [[nodiscard]] const PartLimits& limits() const noexcept { return limits_; }

private:
    std::size_t part_size_;
    std::uint64_t big_file_threshold_;
    PartLimits limits_;
};

} // namespace relay::upload
