#include "common/logging.hpp"
#include "common/errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace attrtools {

spdlog::level::level_enum parseLogLevel(const std::string& level) {
    if (level == "trace")    return spdlog::level::trace;
    if (level == "debug")    return spdlog::level::debug;
    if (level == "info")     return spdlog::level::info;
    if (level == "warning" || level == "warn") return spdlog::level::warn;
    if (level == "error")    return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off")      return spdlog::level::off;
    throw InputFormatError("Unknown log level: " + level);
}

void configureLogging(const std::string& level) {
    auto lvl = parseLogLevel(level);

    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = spdlog::stdout_color_mt(kLoggerName);
    }
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e %l %n: %v");
    logger->set_level(lvl);
    spdlog::set_default_logger(logger);
}

} // namespace attrtools
