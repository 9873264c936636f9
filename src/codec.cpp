#include "mcpconf/codec.hpp"
#include "mcpconf/error.hpp"
#include <simdjson.h>
#include <string>

namespace mcpconf {

namespace {

// Convert simdjson value to an ordered nlohmann document recursively
Json simdjson_to_json(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            Json obj = Json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_json(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            Json arr = Json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_json(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return Json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Try integer first, then double
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return Json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return Json(result_uint.value());
            }
            return Json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return Json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return Json(nullptr);
        default:
            throw CorruptConfigError("Unsupported JSON value");
    }
}

} // anonymous namespace

Json Codec::parse(std::string_view raw) {
    if (raw.find_first_not_of(" \t\r\n") == std::string_view::npos) {
        throw CorruptConfigError("Empty document");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw CorruptConfigError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    simdjson::ondemand::value root;
    error = doc.get_value().get(root);
    if (error) {
        // Scalar documents land here; a registry is always an object.
        throw CorruptConfigError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    Json j;
    try {
        j = simdjson_to_json(root);
    } catch (const CorruptConfigError&) {
        throw;
    } catch (const std::exception& e) {
        throw CorruptConfigError(std::string("JSON parse error: ") + e.what());
    }

    if (!doc.at_end()) {
        throw CorruptConfigError("Trailing content after JSON document");
    }
    return j;
}

std::string Codec::serialize(const Json& doc) {
    return doc.dump(2) + "\n";
}

} // namespace mcpconf
