#pragma once
#include "error.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpconf {

/// Registry documents keep the key order they were read with.
using Json = nlohmann::ordered_json;

// ---------- ServerEntry ----------

struct ServerEntry {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    // Fields of the entry object this tool does not interpret, kept as read.
    Json extra = Json::object();

    bool operator==(const ServerEntry& o) const {
        return name == o.name && command == o.command && args == o.args
               && env == o.env && extra == o.extra;
    }
    bool operator!=(const ServerEntry& o) const { return !(*this == o); }
};

/// Throws InvalidEntryError when name or command is empty.
void validate(const ServerEntry& entry);

// ---------- Snapshot ----------

struct Snapshot {
    std::string timestamp;   // sortable, e.g. 20250314-101502-000042
    std::filesystem::path path;
    std::uintmax_t size = 0;

    bool operator==(const Snapshot& o) const {
        return timestamp == o.timestamp && path == o.path && size == o.size;
    }
};

// ---------- OperationResult ----------

struct OperationResult {
    bool ok = true;
    ErrorKind kind = ErrorKind::None;
    Step step = Step::None;
    std::string detail;
    std::optional<Snapshot> snapshot;     // backup taken before the mutation
    std::optional<ErrorKind> cause;       // underlying failure for wrapped kinds

    static OperationResult success(std::string detail,
                                   std::optional<Snapshot> snapshot = std::nullopt);
    static OperationResult failure(ErrorKind kind, Step step, std::string detail);

    explicit operator bool() const { return ok; }
};

// ---------- JSON conversion ----------

/// Entry body without the name, which is the key in the servers object.
void to_json(Json& j, const ServerEntry& e);
void from_json(const Json& j, ServerEntry& e);

void to_json(Json& j, const Snapshot& s);
void to_json(Json& j, const OperationResult& r);

} // namespace mcpconf
