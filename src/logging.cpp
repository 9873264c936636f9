#include "mcpconf/logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace mcpconf {

void init_logging(int verbosity, const std::optional<std::string>& level_override) {
    // stdout carries command output; logs go to stderr
    if (auto existing = spdlog::get("mcpconf")) {
        spdlog::set_default_logger(existing);
    } else {
        auto logger = spdlog::stderr_color_mt("mcpconf");
        spdlog::set_default_logger(logger);
    }

    spdlog::level::level_enum level = spdlog::level::warn;
    if (verbosity == 1) {
        level = spdlog::level::info;
    } else if (verbosity >= 2) {
        level = spdlog::level::debug;
    }

    if (level_override) {
        auto parsed = spdlog::level::from_str(*level_override);
        // from_str maps unknown names to "off"
        if (parsed != spdlog::level::off || *level_override == "off") {
            level = parsed;
        }
    }

    spdlog::set_level(level);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
}

} // namespace mcpconf
