#pragma once

#include "relay/core/result.hpp"

#include <string>

namespace relay::logging {

/**
 * @brief Install the default spdlog logger
 *
 * Console sink always, plus an append-mode file sink when @p log_file is
 * not empty. Pattern matches the one used by the command-line tools.
 */
Result<void> init(const std::string& level, const std::string& log_file = {});

} // namespace relay::logging
