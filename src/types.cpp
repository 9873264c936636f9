#include "mcpconf/types.hpp"

namespace mcpconf {

namespace {

// Well-formed UTF-8: no overlong forms, surrogates, or code points past U+10FFFF.
bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (c < 0x80) {
            ++i;
            continue;
        } else if (c >= 0xC2 && c <= 0xDF) {
            len = 1;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 2;
            if (c == 0xE0) lo = 0xA0;
            if (c == 0xED) hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 3;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        } else {
            return false;
        }
        if (s.size() - i <= len) return false;
        for (size_t k = 1; k <= len; ++k) {
            auto cc = static_cast<unsigned char>(s[i + k]);
            if (k == 1 ? (cc < lo || cc > hi) : (cc < 0x80 || cc > 0xBF)) return false;
        }
        i += len + 1;
    }
    return true;
}

void require_utf8(const std::string& value, const std::string& entry_name, const char* field) {
    if (!is_valid_utf8(value)) {
        throw InvalidEntryError("Server '" + (is_valid_utf8(entry_name) ? entry_name : std::string("?"))
                                + "': " + field + " is not valid UTF-8");
    }
}

} // anonymous namespace

void validate(const ServerEntry& entry) {
    if (entry.name.empty()) {
        throw InvalidEntryError("Server name must not be empty");
    }
    require_utf8(entry.name, entry.name, "name");
    if (entry.command.empty()) {
        throw InvalidEntryError("Server '" + entry.name + "' has an empty command");
    }
    require_utf8(entry.command, entry.name, "command");
    for (const auto& arg : entry.args) {
        require_utf8(arg, entry.name, "an argument");
    }
    for (const auto& [key, value] : entry.env) {
        require_utf8(key, entry.name, "an env name");
        require_utf8(value, entry.name, "an env value");
    }
}

// ---------- OperationResult ----------

OperationResult OperationResult::success(std::string detail, std::optional<Snapshot> snapshot) {
    OperationResult r;
    r.detail = std::move(detail);
    r.snapshot = std::move(snapshot);
    return r;
}

OperationResult OperationResult::failure(ErrorKind kind, Step step, std::string detail) {
    OperationResult r;
    r.ok = false;
    r.kind = kind;
    r.step = step;
    r.detail = std::move(detail);
    return r;
}

// ---------- ServerEntry ----------

void to_json(Json& j, const ServerEntry& e) {
    j = Json::object();
    j["env"] = Json::object();
    for (const auto& [key, value] : e.env) {
        j["env"][key] = value;
    }
    j["command"] = e.command;
    j["args"] = e.args;
    if (e.extra.is_object()) {
        for (const auto& item : e.extra.items()) {
            j[item.key()] = item.value();
        }
    }
}

void from_json(const Json& j, ServerEntry& e) {
    if (!j.is_object()) {
        throw CorruptConfigError("Server '" + e.name + "' must be a JSON object");
    }
    e.command.clear();
    e.args.clear();
    e.env.clear();
    e.extra = Json::object();

    if (!j.contains("command") || !j.at("command").is_string()) {
        throw CorruptConfigError("Server '" + e.name + "' has no string 'command'");
    }

    for (const auto& item : j.items()) {
        const auto& key = item.key();
        const auto& value = item.value();
        if (key == "command") {
            e.command = value.get<std::string>();
        } else if (key == "args") {
            if (!value.is_array()) {
                throw CorruptConfigError("Server '" + e.name + "': 'args' must be an array");
            }
            for (const auto& arg : value) {
                if (!arg.is_string()) {
                    throw CorruptConfigError("Server '" + e.name + "': 'args' must hold strings");
                }
                e.args.push_back(arg.get<std::string>());
            }
        } else if (key == "env") {
            if (!value.is_object()) {
                throw CorruptConfigError("Server '" + e.name + "': 'env' must be an object");
            }
            for (const auto& var : value.items()) {
                if (!var.value().is_string()) {
                    throw CorruptConfigError("Server '" + e.name + "': env value of '"
                                             + var.key() + "' must be a string");
                }
                e.env[var.key()] = var.value().get<std::string>();
            }
        } else {
            e.extra[key] = value;
        }
    }
}

// ---------- Snapshot ----------

void to_json(Json& j, const Snapshot& s) {
    j = {{"timestamp", s.timestamp}, {"path", s.path.string()}, {"size", s.size}};
}

// ---------- OperationResult ----------

void to_json(Json& j, const OperationResult& r) {
    j = {{"ok", r.ok}, {"detail", r.detail}};
    if (!r.ok) {
        j["error"] = to_string(r.kind);
        j["step"] = to_string(r.step);
    }
    if (r.cause) j["cause"] = to_string(*r.cause);
    if (r.snapshot) j["snapshot"] = *r.snapshot;
}

} // namespace mcpconf
