#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace aim {

/// Shared engine logger ("aim"). Created on first use.
std::shared_ptr<spdlog::logger> logger();

/// Set the engine log level from its name ("trace", "debug", "info",
/// "warn", "error", "critical", "off"). Throws ConfigError on unknown names.
void setLogLevel(const std::string& level);

} // namespace aim
