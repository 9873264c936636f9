#include "mcpconf/mutation_engine.hpp"
#include "mcpconf/atomic_file.hpp"
#include "mcpconf/error.hpp"
#include <spdlog/spdlog.h>

namespace mcpconf {

namespace {

BackupStore::Options backup_options(const std::filesystem::path& dir) {
    BackupStore::Options opts;
    opts.directory = dir;
    return opts;
}

} // anonymous namespace

MutationEngine::MutationEngine(Options opts)
    : opts_(std::move(opts)), backups_(backup_options(opts_.backup_dir)) {
}

MutationEngine::~MutationEngine() = default;

std::optional<OperationResult> MutationEngine::lock(std::optional<FileLock>& guard) {
    if (!opts_.use_lock) return std::nullopt;
    try {
        guard.emplace(opts_.registry_path, opts_.lock_timeout);
    } catch (const ConfigError& e) {
        spdlog::warn("{}", e.what());
        return OperationResult::failure(ErrorKind::LockTimeout, Step::Lock, e.what());
    }
    return std::nullopt;
}

std::optional<OperationResult> MutationEngine::backup(std::optional<Snapshot>& snapshot) {
    try {
        snapshot = backups_.snapshot(opts_.registry_path);
    } catch (const ConfigError& e) {
        spdlog::error("Backup failed, registry left unchanged: {}", e.what());
        return OperationResult::failure(ErrorKind::BackupFailed, Step::Backup, e.what());
    }
    return std::nullopt;
}

OperationResult MutationEngine::apply(const std::string& operation, const Transform& transform) {
    spdlog::debug("{}: {}", operation, opts_.registry_path.string());

    std::optional<FileLock> guard;
    if (auto failed = lock(guard)) return *failed;

    std::optional<Snapshot> snapshot;
    if (auto failed = backup(snapshot)) return *failed;

    Registry registry;
    try {
        registry = Registry::load(opts_.registry_path);
    } catch (const ConfigError& e) {
        spdlog::error("{}", e.what());
        auto r = OperationResult::failure(e.kind, Step::Load, e.what());
        r.snapshot = snapshot;
        return r;
    }

    std::string detail;
    try {
        detail = transform(registry);
    } catch (const ConfigError& e) {
        auto r = OperationResult::failure(e.kind, Step::Mutate, e.what());
        r.snapshot = snapshot;
        return r;
    }

    auto saved = registry.save(opts_.registry_path);
    saved.snapshot = snapshot;
    if (!saved) return saved;

    return OperationResult::success(std::move(detail), std::move(snapshot));
}

OperationResult MutationEngine::add_server(const ServerEntry& entry) {
    try {
        validate(entry);
    } catch (const InvalidEntryError& e) {
        return OperationResult::failure(ErrorKind::InvalidEntry, Step::Validate, e.what());
    }

    return apply("add_server", [&entry](Registry& registry) {
        bool existed = registry.contains(entry.name);
        registry.put(entry);
        return std::string(existed ? "Updated server '" : "Added server '") + entry.name + "'";
    });
}

OperationResult MutationEngine::remove_server(const std::string& name) {
    return apply("remove_server", [&name](Registry& registry) {
        if (registry.remove(name)) {
            return "Removed server '" + name + "'";
        }
        return "Server '" + name + "' was not registered";
    });
}

OperationResult MutationEngine::reset_all() {
    return apply("reset_all", [](Registry& registry) {
        size_t count = registry.size();
        registry.clear();
        return "Removed " + std::to_string(count) + " server(s)";
    });
}

OperationResult MutationEngine::replace_all(std::vector<ServerEntry> entries) {
    Registry staged;
    try {
        staged.replace(std::move(entries));
    } catch (const InvalidEntryError& e) {
        return OperationResult::failure(ErrorKind::InvalidEntry, Step::Validate, e.what());
    }

    return apply("replace_all", [&staged](Registry& registry) {
        registry.replace(staged.servers());
        return "Registry now holds " + std::to_string(registry.size()) + " server(s)";
    });
}

OperationResult MutationEngine::restore_snapshot(const Snapshot& snapshot) {
    spdlog::debug("restore_snapshot: {} from {}", opts_.registry_path.string(), snapshot.path.string());

    std::string content;
    try {
        content = backups_.read(snapshot);
        // Refuse to put back anything that would not load.
        (void)Registry::parse(content);
    } catch (const ConfigError& e) {
        return OperationResult::failure(e.kind, Step::Validate,
                                        snapshot.path.string() + ": " + e.what());
    }

    std::optional<FileLock> guard;
    if (auto failed = lock(guard)) return *failed;

    std::optional<Snapshot> taken;
    if (auto failed = backup(taken)) return *failed;

    try {
        AtomicFile::write_file(opts_.registry_path, content);
    } catch (const ConfigError& e) {
        spdlog::error("Restoring registry failed: {}", e.what());
        auto r = OperationResult::failure(ErrorKind::SaveFailed, Step::Save, e.what());
        r.snapshot = taken;
        return r;
    }

    spdlog::info("Restored {} from {}", opts_.registry_path.string(), snapshot.path.string());
    return OperationResult::success("Restored from " + snapshot.path.filename().string(),
                                    std::move(taken));
}

} // namespace mcpconf
