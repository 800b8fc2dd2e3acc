#include "sqlmcp/codec.hpp"
#include "sqlmcp/error.hpp"
#include "sqlmcp/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace sqlmcp {

namespace {

// Deeper documents are rejected before the recursion can exhaust the stack
constexpr size_t MAX_NESTING_DEPTH = 512;

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val, size_t depth = 0) {
    if (depth > MAX_NESTING_DEPTH) {
        throw McpParseError("JSON nesting too deep");
    }
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value(), depth + 1);
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value(), depth + 1));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Try integer first, then double
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
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            return nlohmann::json(nullptr);
    }
}

} // anonymous namespace

nlohmann::json Codec::parse_document(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    try {
        simdjson::ondemand::value root;
        error = doc.get_value().get(root);
        if (error) {
            throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
        }
        auto j = simdjson_to_nlohmann(root);
        // Trailing content after the root value is not a valid document
        if (!doc.at_end()) {
            throw McpParseError("JSON parse error: trailing content");
        }
        return j;
    } catch (const simdjson::simdjson_error& e) {
        throw McpParseError(std::string("JSON parse error: ") + e.what());
    }
}

JsonRpcRequest Codec::parse_object(const nlohmann::json& j) {
    if (j.contains("jsonrpc")) {
        const auto& version = j.at("jsonrpc");
        if (!version.is_string() || version.get<std::string>() != JSONRPC_VERSION) {
            throw McpParseError("Invalid jsonrpc version, expected '2.0'");
        }
    }

    if (!j.contains("id")) {
        throw McpParseError("Missing 'id' field");
    }
    const auto& id = j.at("id");
    if (!id.is_number_integer() && !id.is_string()) {
        throw McpParseError("Request id must be an integer or a string");
    }
    if (id.is_number_unsigned()
        && id.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw McpParseError("Request id out of range");
    }

    if (!j.contains("method")) {
        throw McpParseError("Missing 'method' field");
    }
    if (!j.at("method").is_string()) {
        throw McpParseError("Request method must be a string");
    }

    JsonRpcRequest req;
    from_json(id, req.id);
    req.method = j.at("method").get<std::string>();
    if (j.contains("params")) {
        const auto& params = j.at("params");
        if (params.is_object()) {
            req.params = params;
        } else if (!params.is_null()) {
            throw McpParseError("Request params must be an object");
        }
    }
    return req;
}

JsonRpcRequest Codec::parse(std::string_view raw) {
    auto j = parse_document(raw);
    if (!j.is_object()) {
        throw McpParseError("Message must be a JSON object");
    }
    return parse_object(j);
}

std::optional<RequestId> Codec::recover_id(std::string_view raw) noexcept {
    if (raw.empty()) return std::nullopt;
    try {
        simdjson::ondemand::parser parser;
        simdjson::padded_string padded(raw.data(), raw.size());

        simdjson::ondemand::document doc;
        if (parser.iterate(padded).get(doc)) return std::nullopt;

        simdjson::ondemand::object obj;
        if (doc.get_object().get(obj)) return std::nullopt;

        simdjson::ondemand::value id;
        if (obj.find_field_unordered("id").get(id)) return std::nullopt;

        simdjson::ondemand::json_type type;
        if (id.type().get(type)) return std::nullopt;

        if (type == simdjson::ondemand::json_type::number) {
            int64_t i = 0;
            if (!id.get_int64().get(i)) return RequestId{i};
        } else if (type == simdjson::ondemand::json_type::string) {
            std::string_view s;
            if (!id.get_string().get(s)) return RequestId{std::string(s)};
        }
    } catch (const std::exception&) {
        // Allocation failure while padding; nothing to recover
    }
    return std::nullopt;
}

JsonRpcResponse Codec::parse_response(std::string_view raw) {
    auto j = parse_document(raw);
    if (!j.is_object()) {
        throw McpParseError("Message must be a JSON object");
    }
    if (!j.contains("jsonrpc") || !j.at("jsonrpc").is_string()
        || j.at("jsonrpc").get<std::string>() != JSONRPC_VERSION) {
        throw McpParseError("Invalid jsonrpc version, expected '2.0'");
    }
    if (!j.contains("id")) {
        throw McpParseError("Missing 'id' field");
    }
    if (j.contains("result") == j.contains("error")) {
        throw McpParseError("Response must carry exactly one of 'result' and 'error'");
    }
    try {
        JsonRpcResponse resp;
        from_json(j, resp);
        return resp;
    } catch (const std::exception& e) {
        throw McpParseError(std::string("Malformed response: ") + e.what());
    }
}

std::string Codec::serialize(const JsonRpcResponse& resp) {
    nlohmann::json j;
    to_json(j, resp);
    return j.dump();
}

std::string Codec::serialize(const JsonRpcRequest& req) {
    nlohmann::json j;
    to_json(j, req);
    return j.dump();
}

std::string Codec::encode_result(const std::optional<RequestId>& id, nlohmann::json result) {
    return serialize(make_result(id, std::move(result)));
}

std::string Codec::encode_error(const std::optional<RequestId>& id, int code,
                                const std::string& message,
                                std::optional<nlohmann::json> data) {
    return serialize(make_error(id, JsonRpcError{code, message, std::move(data)}));
}

} // namespace sqlmcp
