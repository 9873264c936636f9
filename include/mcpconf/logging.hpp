#pragma once
#include <optional>
#include <string>

namespace mcpconf {

/// Install the "mcpconf" stderr logger as spdlog's default logger.
/// verbosity 0 → warn, 1 → info, 2+ → debug. level_override (e.g. from
/// MCPCONF_LOG_LEVEL) wins when it names a valid spdlog level.
void init_logging(int verbosity, const std::optional<std::string>& level_override = std::nullopt);

} // namespace mcpconf
