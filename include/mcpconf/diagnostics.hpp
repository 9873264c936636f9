#pragma once
#include "types.hpp"
#include "probes.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mcpconf {

struct Report {
    std::string generated_at;  // UTC, ISO 8601

    // Registry
    std::filesystem::path registry_path;
    bool registry_exists = false;
    std::optional<std::string> registry_error;
    std::vector<ServerEntry> servers;

    // Backups
    std::filesystem::path backup_dir;
    size_t snapshot_count = 0;
    std::optional<std::string> latest_snapshot;

    // Collaborators, as supplied
    ProbeResults probes;

    // Host log
    std::optional<std::filesystem::path> host_log;
    bool host_log_found = false;
    std::vector<std::string> recent_errors;

    std::optional<std::uintmax_t> free_space_bytes;
    std::vector<std::string> recommendations;

    [[nodiscard]] size_t server_count() const { return servers.size(); }
};

/// Read-only report builder. Missing optional data is reported, never raised.
class Diagnostics {
public:
    struct Options {
        std::optional<std::filesystem::path> host_log;
        size_t log_error_lines = 10;
    };

    Diagnostics();
    explicit Diagnostics(Options opts);

    [[nodiscard]] Report build_report(const std::filesystem::path& registry_path,
                                      const std::filesystem::path& backup_dir,
                                      const ProbeResults& probes) const;

private:
    Options opts_;
};

/// Markdown-style text with one section per area.
std::string render_text(const Report& report);

void to_json(Json& j, const Report& r);

} // namespace mcpconf
