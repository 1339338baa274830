#include <gtest/gtest.h>
#include "linerpc/codec.hpp"
#include "linerpc/error.hpp"
#include <string>

using namespace linerpc;

namespace {

DecodeFailure expect_failure(const DecodeResult& r) {
    EXPECT_TRUE(std::holds_alternative<DecodeFailure>(r));
    return std::get<DecodeFailure>(r);
}

DecodeFailure parse_failure() {
    DecodeFailure f;
    f.error = JsonRpcError{error::ParseError, "Parse error", std::nullopt};
    return f;
}

// `depth` nested arrays around a zero.
std::string nested_arrays(size_t depth) {
    return std::string(depth, '[') + "0" + std::string(depth, ']');
}

} // namespace

// ---- Classification ----

TEST(CodecDecode, ValidRequest) {
    auto msg = Codec::decode(R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<int64_t>(req.id), 1);
    EXPECT_EQ(req.method, "ping");
}

TEST(CodecDecode, ValidRequestStringId) {
    auto msg = Codec::decode(R"({"jsonrpc":"2.0","id":"abc-123","method":"tools/list"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<std::string>(req.id), "abc-123");
    EXPECT_EQ(req.method, "tools/list");
}

TEST(CodecDecode, NullIdIsRequest) {
    auto msg = Codec::decode(R"({"jsonrpc":"2.0","id":null,"method":"ping"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(std::get<JsonRpcRequest>(msg).id));
}

TEST(CodecDecode, FractionalIdKeepsType) {
    auto msg = Codec::decode(R"({"jsonrpc":"2.0","id":7.25,"method":"ping"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    EXPECT_DOUBLE_EQ(std::get<double>(std::get<JsonRpcRequest>(msg).id), 7.25);
}

TEST(CodecDecode, ValidNotification) {
    auto msg = Codec::decode(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcNotification>(msg));
    auto& notif = std::get<JsonRpcNotification>(msg);
    EXPECT_EQ(notif.method, "notifications/initialized");
    EXPECT_EQ(notif.params, json::object());
}

TEST(CodecDecode, MissingParamsDefaultsToEmptyObject) {
    auto msg = Codec::decode(R"({"jsonrpc":"2.0","id":3,"method":"ping"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    EXPECT_EQ(std::get<JsonRpcRequest>(msg).params, json::object());
}

TEST(CodecDecode, ArrayParams) {
    auto msg = Codec::decode(R"({"jsonrpc":"2.0","id":1,"method":"sum","params":[1,2,3]})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    EXPECT_EQ(std::get<JsonRpcRequest>(msg).params, json::array({1, 2, 3}));
}

TEST(CodecDecode, NestedParamsKeepMemberOrder) {
    auto msg = Codec::decode(
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"echo","arguments":{"text":"héllo","n":[1,2.5,true,null]}}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(req.params.dump(),
              "{\"name\":\"echo\",\"arguments\":{\"text\":\"h\xC3\xA9llo\",\"n\":[1,2.5,true,null]}}");
}

// ---- Parse errors ----

TEST(CodecDecode, InvalidJson) {
    auto f = expect_failure(Codec::decode("not valid json"));
    EXPECT_EQ(f.error.code, error::ParseError);
    EXPECT_EQ(f.error.message, "Parse error");
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(f.id));
    EXPECT_FALSE(f.from_notification);
}

TEST(CodecDecode, TruncatedObject) {
    auto f = expect_failure(Codec::decode(R"({"jsonrpc":"2.0","id":5,"method":"ping")"));
    EXPECT_EQ(f.error.code, error::ParseError);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(f.id));
}

TEST(CodecDecode, TrailingContent) {
    auto f = expect_failure(Codec::decode(R"({"jsonrpc":"2.0","id":1,"method":"ping"} {})"));
    EXPECT_EQ(f.error.code, error::ParseError);
}

TEST(CodecDecode, EmptyInput) {
    auto f = expect_failure(Codec::decode(""));
    EXPECT_EQ(f.error.code, error::ParseError);
}

TEST(CodecDecode, ExcessiveNesting) {
    std::string line = R"({"jsonrpc":"2.0","method":"ping","params":{"a":)" + nested_arrays(1100) + R"(},"id":7})";
    EXPECT_EQ(expect_failure(Codec::decode(line)), parse_failure());

    EXPECT_EQ(expect_failure(Codec::decode(nested_arrays(2000))), parse_failure());
}

TEST(CodecDecode, NestingAtLimitIsAccepted) {
    // Root object and params object take two levels
    std::string line = R"({"jsonrpc":"2.0","method":"ping","params":{"a":)" +
                       nested_arrays(Codec::MAX_DEPTH - 2) + R"(},"id":7})";
    EXPECT_TRUE(std::holds_alternative<JsonRpcRequest>(Codec::decode(line)));

    std::string deeper = R"({"jsonrpc":"2.0","method":"ping","params":{"a":)" +
                         nested_arrays(Codec::MAX_DEPTH - 1) + R"(},"id":7})";
    EXPECT_EQ(expect_failure(Codec::decode(deeper)), parse_failure());
}

TEST(CodecParseJson, Throws) {
    EXPECT_THROW(Codec::parse_json("{invalid json"), RpcParseError);
    EXPECT_THROW(Codec::parse_json("nul"), RpcParseError);
    EXPECT_THROW(Codec::parse_json(nested_arrays(Codec::MAX_DEPTH + 1)), RpcParseError);
}

TEST(CodecParseJson, Scalars) {
    EXPECT_EQ(Codec::parse_json("42"), json(42));
    EXPECT_EQ(Codec::parse_json("\"x\""), json("x"));
    EXPECT_TRUE(Codec::parse_json("null").is_null());
    EXPECT_EQ(Codec::parse_json("true"), json(true));
}

// ---- Invalid requests ----

TEST(CodecDecode, NotAnObject) {
    for (const char* line : {"[1,2,3]", "42", "\"text\"", "null", "true", "[]"}) {
        auto f = expect_failure(Codec::decode(line));
        EXPECT_EQ(f.error.code, error::InvalidRequest) << line;
        EXPECT_EQ(f.error.message, "Invalid Request");
        EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(f.id)) << line;
    }
}

TEST(CodecDecode, MissingJsonrpcEchoesId) {
    auto f = expect_failure(Codec::decode(R"({"id":9,"method":"ping"})"));
    EXPECT_EQ(f.error.code, error::InvalidRequest);
    EXPECT_EQ(std::get<int64_t>(f.id), 9);
}

TEST(CodecDecode, WrongJsonrpcVersion) {
    auto f = expect_failure(Codec::decode(R"({"jsonrpc":"1.0","id":"x","method":"ping"})"));
    EXPECT_EQ(f.error.code, error::InvalidRequest);
    EXPECT_EQ(std::get<std::string>(f.id), "x");
}

TEST(CodecDecode, NumericJsonrpcVersion) {
    auto f = expect_failure(Codec::decode(R"({"jsonrpc":2.0,"id":1,"method":"ping"})"));
    EXPECT_EQ(f.error.code, error::InvalidRequest);
}

TEST(CodecDecode, MissingMethod) {
    auto f = expect_failure(Codec::decode(R"({"jsonrpc":"2.0","id":4})"));
    EXPECT_EQ(f.error.code, error::InvalidRequest);
    EXPECT_EQ(std::get<int64_t>(f.id), 4);
}

TEST(CodecDecode, ResponseShapedMessageIsInvalidRequest) {
    auto f = expect_failure(Codec::decode(R"({"jsonrpc":"2.0","id":42,"result":{}})"));
    EXPECT_EQ(f.error.code, error::InvalidRequest);
    EXPECT_EQ(std::get<int64_t>(f.id), 42);
}

TEST(CodecDecode, NonStringMethod) {
    auto f = expect_failure(Codec::decode(R"({"jsonrpc":"2.0","id":1,"method":5})"));
    EXPECT_EQ(f.error.code, error::InvalidRequest);
}

TEST(CodecDecode, StructuredIdIsNotEchoed) {
    auto f = expect_failure(Codec::decode(R"({"jsonrpc":"2.0","id":{"a":1},"method":"ping"})"));
    EXPECT_EQ(f.error.code, error::InvalidRequest);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(f.id));

    auto g = expect_failure(Codec::decode(R"({"jsonrpc":"2.0","id":true,"method":"ping"})"));
    EXPECT_EQ(g.error.code, error::InvalidRequest);
}

TEST(CodecDecode, OversizedIntegerIdIsRejected) {
    auto f = expect_failure(Codec::decode(
        R"({"jsonrpc":"2.0","method":"p","id":123456789012345678901234567890})"));
    EXPECT_EQ(f.error.code, error::InvalidRequest);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(f.id));
    EXPECT_FALSE(f.from_notification);

    auto g = expect_failure(Codec::decode(R"({"jsonrpc":"2.0","method":"p","id":-99999999999999999999})"));
    EXPECT_EQ(g.error.code, error::InvalidRequest);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(g.id));
}

TEST(CodecDecode, Uint64IdAtLimitIsKept) {
    auto msg = Codec::decode(R"({"jsonrpc":"2.0","method":"p","id":18446744073709551615})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    EXPECT_EQ(std::get<uint64_t>(std::get<JsonRpcRequest>(msg).id), 18446744073709551615ULL);
}

TEST(CodecDecode, OversizedIntegerInParamsIsAccepted) {
    auto msg = Codec::decode(R"({"jsonrpc":"2.0","method":"p","params":{"n":123456789012345678901234567890},"id":1})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    EXPECT_TRUE(std::get<JsonRpcRequest>(msg).params.at("n").is_number_float());
}

// ---- Invalid params ----

TEST(CodecDecode, ScalarParamsOnRequest) {
    auto f = expect_failure(Codec::decode(R"({"jsonrpc":"2.0","id":"p","method":"ping","params":"x"})"));
    EXPECT_EQ(f.error.code, error::InvalidParams);
    EXPECT_EQ(f.error.message, "Invalid params");
    EXPECT_EQ(std::get<std::string>(f.id), "p");
    EXPECT_FALSE(f.from_notification);
}

TEST(CodecDecode, NullParamsOnNotification) {
    auto f = expect_failure(Codec::decode(R"({"jsonrpc":"2.0","method":"log","params":null})"));
    EXPECT_EQ(f.error.code, error::InvalidParams);
    EXPECT_TRUE(f.from_notification);
}

// ---- Serialize ----

TEST(CodecSerialize, SuccessLine) {
    auto resp = JsonRpcResponse::success(RequestId{int64_t{1}},
        json{{"message", "pong"}, {"received_params", {{"data", "hello"}}}});
    EXPECT_EQ(Codec::serialize(resp),
              R"({"jsonrpc":"2.0","result":{"message":"pong","received_params":{"data":"hello"}},"id":1})");
}

TEST(CodecSerialize, ErrorLine) {
    auto resp = JsonRpcResponse::failure(RequestId{nullptr},
        JsonRpcError{error::ParseError, "Parse error", std::nullopt});
    EXPECT_EQ(Codec::serialize(resp),
              R"({"jsonrpc":"2.0","error":{"code":-32700,"message":"Parse error"},"id":null})");
}

TEST(CodecSerialize, NoEmbeddedNewlines) {
    auto resp = JsonRpcResponse::success(RequestId{int64_t{1}}, json("line1\nline2"));
    std::string out = Codec::serialize(resp);
    EXPECT_EQ(out.find('\n'), std::string::npos);
}

TEST(CodecSerialize, InvalidUtf8Throws) {
    auto resp = JsonRpcResponse::success(RequestId{int64_t{1}}, json(std::string("\xFF\xFE")));
    EXPECT_THROW((void)Codec::serialize(resp), json::type_error);
}

// ---- Large message test ----

TEST(CodecDecode, LargeMessage) {
    json items = json::array();
    for (int i = 0; i < 100; ++i) {
        items.push_back({
            {"name", "item_" + std::to_string(i)},
            {"description", "Description for item " + std::to_string(i)},
            {"schema", {{"type", "object"}, {"properties", json::object()}}}
        });
    }
    json request = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", "bulk/import"},
        {"params", {{"items", items}}}
    };
    auto msg = Codec::decode(request.dump());
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    EXPECT_EQ(std::get<JsonRpcRequest>(msg).params["items"].size(), 100u);
}
