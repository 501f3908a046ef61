#include "mcpecho/codec.hpp"
#include "mcpecho/error.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace mcpecho {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type().value()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            auto object = val.get_object();
            for (auto field : object) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Try integer first, then double. Integers beyond the uint64 range
            // have no exact nlohmann representation and become doubles.
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null: {
            bool is_null = val.is_null();
            if (!is_null) {
                throw McpParseError("Invalid literal, expected 'null'");
            }
            return nlohmann::json(nullptr);
        }
        default:
            throw McpParseError("Unexpected JSON value type");
    }
}

// A scalar document cannot be read through get_value(); each scalar kind
// has its own root accessor.
nlohmann::json simdjson_doc_to_nlohmann(simdjson::ondemand::document& doc) {
    switch (doc.type().value()) {
        case simdjson::ondemand::json_type::object:
        case simdjson::ondemand::json_type::array:
            return simdjson_to_nlohmann(doc.get_value().value());
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = doc.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            auto result_int = doc.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = doc.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(doc.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(doc.get_bool().value());
        case simdjson::ondemand::json_type::null: {
            bool is_null = doc.is_null();
            if (!is_null) {
                throw McpParseError("Invalid literal, expected 'null'");
            }
            return nlohmann::json(nullptr);
        }
        default:
            throw McpParseError("Unexpected JSON value type");
    }
}

std::string method_text(const nlohmann::json& method) {
    if (method.is_string()) return method.get<std::string>();
    return method.dump();
}

} // anonymous namespace

nlohmann::json Codec::parse_json(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw McpParseError(simdjson::error_message(error));
    }

    // The on-demand parser validates lazily, so errors surface while
    // walking the document.
    nlohmann::json j;
    try {
        j = simdjson_doc_to_nlohmann(doc);
    } catch (const simdjson::simdjson_error& e) {
        throw McpParseError(e.what());
    }

    if (!doc.at_end()) {
        throw McpParseError("Unexpected trailing content after JSON value");
    }
    return j;
}

JsonRpcMessage Codec::decode(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw McpProtocolError(error::InvalidRequest,
                               "Invalid Request: message must be a JSON object");
    }

    // 'jsonrpc' is not checked: peers that omit or misspell it are still served.
    bool has_id = j.contains("id");
    bool has_method = j.contains("method");

    std::optional<nlohmann::json> params;
    if (j.contains("params") && !j.at("params").is_null()) {
        params = j.at("params");
    }

    if (has_method && !has_id) {
        JsonRpcNotification notif;
        notif.method = method_text(j.at("method"));
        notif.params = std::move(params);
        return notif;
    }

    // A message without a method is answered as a request for method "",
    // with its id (or null) echoed back.
    JsonRpcRequest req;
    req.id = has_id ? j.at("id") : nlohmann::json(nullptr);
    req.method = has_method ? method_text(j.at("method")) : std::string();
    req.params = std::move(params);
    return req;
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    return decode(parse_json(raw));
}

std::string Codec::serialize(const JsonRpcResponse& resp) {
    nlohmann::json j;
    to_json(j, resp);
    return j.dump();
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump();
}

} // namespace mcpecho
