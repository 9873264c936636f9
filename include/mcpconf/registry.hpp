#pragma once
#include "types.hpp"
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace mcpconf {

/// In-memory view of the host application's config file: the servers
/// mapping plus every other top-level field, preserved as read.
class Registry {
public:
    Registry();

    /// Read the registry at path. A missing file yields an empty registry.
    /// Throws CorruptConfigError if the file cannot be read or parsed.
    [[nodiscard]] static Registry load(const std::filesystem::path& path);

    /// Throws CorruptConfigError.
    [[nodiscard]] static Registry parse(std::string_view text);
    [[nodiscard]] static Registry from_json(const Json& doc);

    /// Atomically replace the file at path with dump().
    [[nodiscard]] OperationResult save(const std::filesystem::path& path) const;

    [[nodiscard]] Json to_json() const;
    [[nodiscard]] std::string dump() const;

    /// Insert or replace the entry keyed by entry.name. A replaced entry keeps
    /// its position. Throws InvalidEntryError.
    void put(ServerEntry entry);

    /// Returns false if no entry had that name.
    bool remove(const std::string& name);

    void clear();

    /// Replace every entry. Throws InvalidEntryError on invalid or
    /// duplicate names, leaving the registry unchanged.
    void replace(std::vector<ServerEntry> entries);

    [[nodiscard]] const ServerEntry* find(const std::string& name) const;
    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] size_t size() const { return servers_.size(); }
    [[nodiscard]] bool empty() const { return servers_.empty(); }
    [[nodiscard]] const std::vector<ServerEntry>& servers() const { return servers_; }

    /// Top-level fields other than the servers mapping.
    [[nodiscard]] Json extras() const;

    bool operator==(const Registry& o) const {
        return servers_ == o.servers_ && extras() == o.extras();
    }

private:
    std::vector<ServerEntry> servers_;
    // Top-level object as read; the servers key keeps its slot so that it is
    // written back in the same position.
    Json document_;
};

} // namespace mcpconf
