#include "common/logging.hpp"
#include "common/errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace aim {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] {
        instance = spdlog::get("aim");
        if (!instance) {
            instance = spdlog::stderr_color_mt("aim");
            instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [t%t] %v");
        }
    });
    return instance;
}

void setLogLevel(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        throw ConfigError("Unknown log level: " + level);
    }
    logger()->set_level(parsed);
}

} // namespace aim
