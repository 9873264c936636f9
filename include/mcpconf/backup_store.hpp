#pragma once
#include "types.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mcpconf {

/// BackupStore keeps append-only, timestamped copies of the registry file in
/// one directory. Files are named "<prefix>-<timestamp><suffix>" so that
/// sorting by timestamp orders them oldest first. Snapshots are never
/// modified or deleted here.
class BackupStore {
public:
    struct Options {
        std::filesystem::path directory;
        std::string prefix = "claude_desktop_config";
        std::string suffix = ".json";
    };

    explicit BackupStore(Options opts);

    /// Copy the file at registry_path verbatim into the backup directory.
    /// Returns std::nullopt without touching the disk if the file does not
    /// exist. Throws BackupFailedError.
    [[nodiscard]] std::optional<Snapshot> snapshot(const std::filesystem::path& registry_path);

    /// Oldest first. A missing directory yields an empty list.
    [[nodiscard]] std::vector<Snapshot> list_snapshots() const;
    [[nodiscard]] std::optional<Snapshot> latest() const;

    /// Look up by file name, timestamp, or "latest".
    /// Throws SnapshotNotFoundError.
    [[nodiscard]] Snapshot find(const std::string& ref) const;

    /// Exact bytes of a snapshot. Throws SnapshotNotFoundError.
    [[nodiscard]] std::string read(const Snapshot& snapshot) const;

    [[nodiscard]] const Options& options() const { return opts_; }

    /// UTC "YYYYMMDD-HHMMSS-uuuuuu".
    static std::string format_timestamp(std::chrono::system_clock::time_point tp);

private:
    [[nodiscard]] std::optional<std::string> timestamp_of(const std::string& file_name) const;

    Options opts_;
};

} // namespace mcpconf
