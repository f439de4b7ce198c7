#pragma once

#include "ofs/core/config.hpp"
#include "ofs/core/result.hpp"

namespace ofs {

/**
 * @brief Install the process-wide spdlog default logger
 *
 * Always logs to a colored stdout sink; when `config.file` is set a file sink
 * is added alongside it. Components log through spdlog's free functions, so
 * this only needs to run once near startup.
 *
 * RETURNS: Validation error for an unknown level name or an unwritable file
 */
Result<void> init_logging(const LoggingConfig& config);

} // namespace ofs
