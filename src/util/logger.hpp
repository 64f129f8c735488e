#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace agentbus::util {

// Initialize logging with console output
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Parse "trace", "debug", "info", "warn", "error", "critical" or "off".
// Unknown names map to info.
spdlog::level::level_enum level_from_string(const std::string& name);

} // namespace agentbus::util
