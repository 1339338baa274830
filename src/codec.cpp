#include "linerpc/codec.hpp"
#include "linerpc/error.hpp"
#include "linerpc/version.hpp"
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace linerpc {

namespace {

struct ParseState {
    // The top-level "id" member held an integer wider than 64 bits
    bool oversized_id = false;
};

bool is_big_integer(simdjson::ondemand::value val) {
    if (val.type().value() != simdjson::ondemand::json_type::number) return false;
    return val.get_number_type().value() == simdjson::ondemand::number_type::big_integer;
}

void check_depth(size_t depth) {
    if (depth > Codec::MAX_DEPTH) {
        throw RpcParseError("Nesting exceeds " + std::to_string(Codec::MAX_DEPTH) + " levels");
    }
}

// Numbers beyond 64 bits keep their magnitude as a double.
template <typename Source>
json number_to_json(Source& src) {
    simdjson::ondemand::number_type kind = src.get_number_type().value();
    switch (kind) {
        case simdjson::ondemand::number_type::signed_integer:
            return json(src.get_int64().value());
        case simdjson::ondemand::number_type::unsigned_integer:
            return json(src.get_uint64().value());
        case simdjson::ondemand::number_type::floating_point_number:
            return json(src.get_double().value());
        default: {
            std::string_view token = src.raw_json_token();
            return json(std::stod(std::string(token)));
        }
    }
}

// Convert simdjson value to json recursively. `depth` is the container
// level of `val`; it is checked before simdjson descends into it.
json simdjson_to_json(simdjson::ondemand::value val, ParseState& state, size_t depth) {
    switch (val.type().value()) {
        case simdjson::ondemand::json_type::object: {
            check_depth(depth);
            json obj = json::object();
            for (auto field : val.get_object()) {
                std::string key(field.unescaped_key().value());
                simdjson::ondemand::value child = field.value().value();
                if (depth == 1 && key == "id" && is_big_integer(child)) {
                    state.oversized_id = true;
                }
                obj[key] = simdjson_to_json(child, state, depth + 1);
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            check_depth(depth);
            json arr = json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_json(elem.value(), state, depth + 1));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string:
            return json(std::string(val.get_string().value()));
        case simdjson::ondemand::json_type::number:
            return number_to_json(val);
        case simdjson::ondemand::json_type::boolean:
            return json(val.get_bool().value());
        case simdjson::ondemand::json_type::null: {
            bool is_null = val.is_null();
            if (!is_null) {
                throw RpcParseError("Invalid literal");
            }
            return json(nullptr);
        }
    }
    throw RpcParseError("Unknown JSON value type");
}

// The on-demand API treats a scalar root differently from a container root.
json simdjson_doc_to_json(simdjson::ondemand::document& doc, ParseState& state) {
    switch (doc.type().value()) {
        case simdjson::ondemand::json_type::object:
        case simdjson::ondemand::json_type::array:
            return simdjson_to_json(doc.get_value().value(), state, 1);
        case simdjson::ondemand::json_type::string:
            return json(std::string(doc.get_string().value()));
        case simdjson::ondemand::json_type::number:
            return number_to_json(doc);
        case simdjson::ondemand::json_type::boolean:
            return json(doc.get_bool().value());
        case simdjson::ondemand::json_type::null: {
            bool is_null = doc.is_null();
            if (!is_null) {
                throw RpcParseError("Invalid literal");
            }
            return json(nullptr);
        }
    }
    throw RpcParseError("Unknown JSON value type");
}

json parse_document(std::string_view raw, ParseState& state) {
    if (raw.empty()) {
        throw RpcParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw RpcParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    json j;
    try {
        j = simdjson_doc_to_json(doc, state);
    } catch (const simdjson::simdjson_error& e) {
        throw RpcParseError(std::string("JSON parse error: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw RpcParseError(std::string("JSON number error: ") + e.what());
    } catch (const std::out_of_range& e) {
        throw RpcParseError(std::string("JSON number error: ") + e.what());
    }

    if (!doc.at_end()) {
        throw RpcParseError("Trailing content after JSON value");
    }
    return j;
}

DecodeFailure make_failure(int code, RequestId id = nullptr, bool from_notification = false) {
    DecodeFailure f;
    f.error = JsonRpcError{code, std::string(error::default_message(code)), std::nullopt};
    f.id = std::move(id);
    f.from_notification = from_notification;
    return f;
}

} // anonymous namespace

json Codec::parse_json(std::string_view raw) {
    ParseState state;
    return parse_document(raw, state);
}

DecodeResult Codec::classify(const json& j) {
    if (!j.is_object()) {
        return make_failure(error::InvalidRequest);
    }

    // Best-effort correlation: echo any well-formed id, even on failure.
    bool has_id = j.contains("id");
    std::optional<RequestId> id;
    if (has_id) {
        id = id_from_json(j.at("id"));
    }
    RequestId reply_id = id ? *id : RequestId{nullptr};

    auto version = j.find("jsonrpc");
    if (version == j.end() || !version->is_string() ||
        version->get<std::string>() != JSONRPC_VERSION) {
        return make_failure(error::InvalidRequest, reply_id);
    }

    auto method = j.find("method");
    if (method == j.end() || !method->is_string()) {
        return make_failure(error::InvalidRequest, reply_id);
    }

    if (has_id && !id) {
        return make_failure(error::InvalidRequest);
    }

    json params = json::object();
    auto p = j.find("params");
    if (p != j.end()) {
        if (!p->is_object() && !p->is_array()) {
            return make_failure(error::InvalidParams, reply_id, !has_id);
        }
        params = *p;
    }

    if (has_id) {
        JsonRpcRequest req;
        req.id = std::move(*id);
        req.method = method->get<std::string>();
        req.params = std::move(params);
        return req;
    }

    JsonRpcNotification notif;
    notif.method = method->get<std::string>();
    notif.params = std::move(params);
    return notif;
}

DecodeResult Codec::decode(std::string_view line) {
    ParseState state;
    json j;
    try {
        j = parse_document(line, state);
    } catch (const RpcParseError&) {
        return make_failure(error::ParseError);
    }
    // A wider integer cannot be echoed back unchanged
    if (state.oversized_id) {
        return make_failure(error::InvalidRequest);
    }
    return classify(j);
}

std::string Codec::serialize(const JsonRpcResponse& resp) {
    json j;
    to_json(j, resp);
    return j.dump();
}

} // namespace linerpc
