#pragma once
#include "types.hpp"
#include "backup_store.hpp"
#include "file_lock.hpp"
#include "registry.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mcpconf {

/// MutationEngine is the only writer of the registry file. Every operation
/// locks the registry, backs up the existing file, loads, transforms, and
/// saves. A failure at any step leaves the file as it was found.
class MutationEngine {
public:
    struct Options {
        std::filesystem::path registry_path;
        std::filesystem::path backup_dir;
        std::chrono::milliseconds lock_timeout{5000};
        bool use_lock = true;
    };

    explicit MutationEngine(Options opts);
    ~MutationEngine();

    MutationEngine(const MutationEngine&) = delete;
    MutationEngine& operator=(const MutationEngine&) = delete;

    /// Insert or overwrite (whole entry) the server keyed by entry.name.
    [[nodiscard]] OperationResult add_server(const ServerEntry& entry);

    /// Removing an absent name succeeds.
    [[nodiscard]] OperationResult remove_server(const std::string& name);

    /// Empty the servers mapping; other top-level fields are kept.
    [[nodiscard]] OperationResult reset_all();

    [[nodiscard]] OperationResult replace_all(std::vector<ServerEntry> entries);

    /// Put the snapshot's bytes back in place after validating them.
    [[nodiscard]] OperationResult restore_snapshot(const Snapshot& snapshot);

    [[nodiscard]] const Options& options() const { return opts_; }
    [[nodiscard]] const BackupStore& backups() const { return backups_; }

private:
    using Transform = std::function<std::string(Registry&)>;

    OperationResult apply(const std::string& operation, const Transform& transform);
    std::optional<OperationResult> lock(std::optional<FileLock>& guard);
    std::optional<OperationResult> backup(std::optional<Snapshot>& snapshot);

    Options opts_;
    BackupStore backups_;
};

} // namespace mcpconf
