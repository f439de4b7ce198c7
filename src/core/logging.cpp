#include "ofs/core/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace ofs {

Result<void> init_logging(const LoggingConfig& config) {
    auto level = spdlog::level::from_str(config.level);
    // from_str falls back to "off" for names it does not know
    if (level == spdlog::level::off && config.level != "off") {
        return Fail<void>(ErrorKind::Validation, "unknown log level '" + config.level + "'");
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (config.file) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file->string(), false));
        } catch (const spdlog::spdlog_ex& e) {
            return Fail<void>(ErrorKind::Validation, std::string("cannot open log file: ") + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("ofs", sinks.begin(), sinks.end());
    logger->set_pattern(config.pattern);
    logger->set_level(level);
    spdlog::set_default_logger(logger);

    spdlog::debug("Logging initialised (level={})", config.level);
    return Ok();
}

} // namespace ofs
