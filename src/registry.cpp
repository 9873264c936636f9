#include "mcpconf/registry.hpp"
#include "mcpconf/atomic_file.hpp"
#include "mcpconf/codec.hpp"
#include "mcpconf/error.hpp"
#include "mcpconf/version.hpp"
#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>
#include <system_error>
#include <spdlog/spdlog.h>

namespace mcpconf {

namespace fs = std::filesystem;

Registry::Registry() : document_(Json::object()) {
}

Registry Registry::load(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        spdlog::debug("Registry {} does not exist, starting empty", path.string());
        return Registry{};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw CorruptConfigError("Cannot read registry '" + path.string() + "'");
    }
    std::ostringstream oss;
    oss << file.rdbuf();

    try {
        return parse(oss.str());
    } catch (const CorruptConfigError& e) {
        throw CorruptConfigError(path.string() + ": " + e.what());
    }
}

Registry Registry::parse(std::string_view text) {
    return from_json(Codec::parse(text));
}

Registry Registry::from_json(const Json& doc) {
    if (!doc.is_object()) {
        throw CorruptConfigError("Registry must be a JSON object");
    }

    Registry reg;
    reg.document_ = doc;

    const std::string key(SERVERS_KEY);
    if (!doc.contains(key) || doc.at(key).is_null()) {
        return reg;
    }
    const auto& servers = doc.at(key);
    if (!servers.is_object()) {
        throw CorruptConfigError("'" + key + "' must be a JSON object");
    }

    for (const auto& item : servers.items()) {
        ServerEntry entry;
        entry.name = item.key();
        mcpconf::from_json(item.value(), entry);
        reg.servers_.push_back(std::move(entry));
    }
    return reg;
}

Json Registry::to_json() const {
    Json servers = Json::object();
    for (const auto& entry : servers_) {
        Json body;
        mcpconf::to_json(body, entry);
        servers[entry.name] = std::move(body);
    }

    Json doc = document_.is_object() ? document_ : Json::object();
    doc[std::string(SERVERS_KEY)] = std::move(servers);
    return doc;
}

std::string Registry::dump() const {
    return Codec::serialize(to_json());
}

OperationResult Registry::save(const fs::path& path) const {
    std::string text;
    try {
        text = dump();
    } catch (const Json::exception& e) {
        // Pass-through fields can hold bytes that are not valid UTF-8.
        spdlog::error("Cannot serialize registry: {}", e.what());
        return OperationResult::failure(ErrorKind::SaveFailed, Step::Save,
                                        std::string("Cannot serialize registry: ") + e.what());
    }

    try {
        AtomicFile::write_file(path, text);
    } catch (const SaveFailedError& e) {
        spdlog::error("Saving registry failed: {}", e.what());
        return OperationResult::failure(ErrorKind::SaveFailed, Step::Save, e.what());
    }
    spdlog::info("Saved {} server(s) to {}", servers_.size(), path.string());
    return OperationResult::success("Saved " + path.string());
}

void Registry::put(ServerEntry entry) {
    validate(entry);
    auto it = std::find_if(servers_.begin(), servers_.end(),
                           [&](const ServerEntry& e) { return e.name == entry.name; });
    if (it != servers_.end()) {
        *it = std::move(entry);
    } else {
        servers_.push_back(std::move(entry));
    }
}

bool Registry::remove(const std::string& name) {
    auto it = std::find_if(servers_.begin(), servers_.end(),
                           [&](const ServerEntry& e) { return e.name == name; });
    if (it == servers_.end()) return false;
    servers_.erase(it);
    return true;
}

void Registry::clear() {
    servers_.clear();
}

void Registry::replace(std::vector<ServerEntry> entries) {
    std::set<std::string> seen;
    for (const auto& entry : entries) {
        validate(entry);
        if (!seen.insert(entry.name).second) {
            throw InvalidEntryError("Duplicate server name '" + entry.name + "'");
        }
    }
    servers_ = std::move(entries);
}

const ServerEntry* Registry::find(const std::string& name) const {
    auto it = std::find_if(servers_.begin(), servers_.end(),
                           [&](const ServerEntry& e) { return e.name == name; });
    return it == servers_.end() ? nullptr : &*it;
}

bool Registry::contains(const std::string& name) const {
    return find(name) != nullptr;
}

Json Registry::extras() const {
    Json out = document_.is_object() ? document_ : Json::object();
    out.erase(std::string(SERVERS_KEY));
    return out;
}

} // namespace mcpconf
