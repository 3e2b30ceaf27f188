#pragma once

#include <spdlog/spdlog.h>
#include <string>

namespace attrtools {

/// Name of the default logger installed by configureLogging().
inline constexpr const char* kLoggerName = "attrtools";

/// Install a colored stdout logger named kLoggerName as the spdlog
/// default and set its level ("trace", "debug", "info", "warning",
/// "error", "critical" or "off"). Safe to call more than once.
void configureLogging(const std::string& level = "info");

/// Parse a level name. Throws InputFormatError on unknown names.
spdlog::level::level_enum parseLogLevel(const std::string& level);

} // namespace attrtools
