#pragma once
#include "types.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace mcpconf {

class Codec {
public:
    /// Parse raw bytes of a registry document, keeping key order.
    /// Throws CorruptConfigError on invalid JSON or trailing content.
    [[nodiscard]] static Json parse(std::string_view raw);

    /// Serialize with 2-space indentation and a trailing newline.
    [[nodiscard]] static std::string serialize(const Json& doc);
};

} // namespace mcpconf
