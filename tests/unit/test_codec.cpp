#include <gtest/gtest.h>
#include "mcpecho/codec.hpp"
#include "mcpecho/error.hpp"

using namespace mcpecho;

// ---- parse_json tests ----

TEST(CodecParseJson, Object) {
    auto j = Codec::parse_json(R"({"a":1,"b":[true,null,"x"],"c":{"d":-2.5}})");
    ASSERT_TRUE(j.is_object());
    EXPECT_EQ(j["a"], 1);
    EXPECT_EQ(j["b"][0], true);
    EXPECT_TRUE(j["b"][1].is_null());
    EXPECT_EQ(j["b"][2], "x");
    EXPECT_DOUBLE_EQ(j["c"]["d"].get<double>(), -2.5);
}

TEST(CodecParseJson, NumberTypesPreserved) {
    auto j = Codec::parse_json(R"({"i":7,"u":18446744073709551615,"f":1.0})");
    EXPECT_TRUE(j["i"].is_number_integer());
    EXPECT_TRUE(j["u"].is_number_unsigned());
    EXPECT_TRUE(j["f"].is_number_float());
}

TEST(CodecParseJson, ScalarDocuments) {
    EXPECT_EQ(Codec::parse_json("42"), 42);
    EXPECT_EQ(Codec::parse_json(R"("text")"), "text");
    EXPECT_EQ(Codec::parse_json("true"), true);
    EXPECT_TRUE(Codec::parse_json("null").is_null());
}

TEST(CodecParseJson, NotJsonAtAll) {
    EXPECT_THROW((void)Codec::parse_json("not json at all"), McpParseError);
}

TEST(CodecParseJson, TruncatedObject) {
    EXPECT_THROW((void)Codec::parse_json(R"({"jsonrpc":"2.0","id":1)"), McpParseError);
}

TEST(CodecParseJson, InvalidJson) {
    EXPECT_THROW((void)Codec::parse_json("{invalid json"), McpParseError);
}

TEST(CodecParseJson, TrailingContent) {
    EXPECT_THROW((void)Codec::parse_json(R"({"id":1} extra)"), McpParseError);
}

TEST(CodecParseJson, EmptyInput) {
    EXPECT_THROW((void)Codec::parse_json(""), McpParseError);
}

TEST(CodecParseJson, ErrorMessageHasDetails) {
    try {
        (void)Codec::parse_json("{invalid json");
        FAIL() << "expected McpParseError";
    } catch (const McpParseError& e) {
        EXPECT_FALSE(std::string(e.what()).empty());
    }
}

// ---- decode tests ----

TEST(CodecDecode, Request) {
    auto msg = Codec::decode(nlohmann::json::parse(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})"));
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(req.id, 1);
    EXPECT_EQ(req.method, "initialize");
    ASSERT_TRUE(req.params.has_value());
    EXPECT_TRUE(req.params->is_object());
}

TEST(CodecDecode, StringId) {
    auto msg = Codec::decode(nlohmann::json::parse(
        R"({"jsonrpc":"2.0","id":"abc-123","method":"tools/list"})"));
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(req.id, "abc-123");
    EXPECT_FALSE(req.params.has_value());
}

TEST(CodecDecode, ExplicitNullIdIsStillARequest) {
    auto msg = Codec::decode(nlohmann::json::parse(
        R"({"jsonrpc":"2.0","id":null,"method":"tools/list"})"));
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    EXPECT_TRUE(std::get<JsonRpcRequest>(msg).id.is_null());
}

TEST(CodecDecode, Notification) {
    auto msg = Codec::decode(nlohmann::json::parse(
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})"));
    ASSERT_TRUE(std::holds_alternative<JsonRpcNotification>(msg));
    EXPECT_EQ(std::get<JsonRpcNotification>(msg).method, "notifications/initialized");
}

TEST(CodecDecode, MissingMethodIsEmptyMethodRequest) {
    auto msg = Codec::decode(nlohmann::json::parse(R"({"jsonrpc":"2.0","id":9})"));
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(req.id, 9);
    EXPECT_EQ(req.method, "");
}

TEST(CodecDecode, EmptyObjectIsRequestWithNullId) {
    auto msg = Codec::decode(nlohmann::json::object());
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_TRUE(req.id.is_null());
    EXPECT_EQ(req.method, "");
}

TEST(CodecDecode, MissingJsonrpcIsTolerated) {
    auto msg = Codec::decode(nlohmann::json::parse(R"({"id":1,"method":"tools/list"})"));
    EXPECT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
}

TEST(CodecDecode, NonStringMethodRenderedAsJson) {
    auto msg = Codec::decode(nlohmann::json::parse(R"({"id":1,"method":5})"));
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    EXPECT_EQ(std::get<JsonRpcRequest>(msg).method, "5");
}

TEST(CodecDecode, NullParamsTreatedAsAbsent) {
    auto msg = Codec::decode(nlohmann::json::parse(R"({"id":1,"method":"x","params":null})"));
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    EXPECT_FALSE(std::get<JsonRpcRequest>(msg).params.has_value());
}

TEST(CodecDecode, NotAnObject) {
    try {
        (void)Codec::decode(nlohmann::json::parse("[1,2,3]"));
        FAIL() << "expected McpProtocolError";
    } catch (const McpProtocolError& e) {
        EXPECT_EQ(e.code, error::InvalidRequest);
    }
}

// ---- Serialize tests ----

TEST(CodecSerialize, ResultResponse) {
    JsonRpcResponse resp;
    resp.id = 1;
    resp.result = nlohmann::json{{"ok", true}};
    std::string out = Codec::serialize(resp);
    EXPECT_EQ(out.find('\n'), std::string::npos);

    auto j = nlohmann::json::parse(out);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["result"]["ok"], true);
    EXPECT_FALSE(j.contains("error"));
}

TEST(CodecSerialize, ErrorResponseWithNullId) {
    auto resp = make_error_response(nullptr, error::ParseError, "Parse error: bad");
    auto j = nlohmann::json::parse(Codec::serialize(resp));
    EXPECT_TRUE(j.contains("id"));
    EXPECT_TRUE(j["id"].is_null());
    EXPECT_EQ(j["error"]["code"], -32700);
    EXPECT_EQ(j["error"]["message"], "Parse error: bad");
    EXPECT_FALSE(j.contains("result"));
}

TEST(CodecSerialize, EmbeddedNewlinesAreEscaped) {
    JsonRpcResponse resp;
    resp.id = 2;
    resp.result = nlohmann::json{{"text", "line one\nline two"}};
    std::string out = Codec::serialize(resp);
    EXPECT_EQ(out.find('\n'), std::string::npos);
    EXPECT_EQ(nlohmann::json::parse(out)["result"]["text"], "line one\nline two");
}

TEST(CodecSerialize, NotificationParsesBack) {
    JsonRpcNotification notif;
    notif.method = "notifications/initialized";
    auto parsed = Codec::parse(Codec::serialize(JsonRpcMessage{notif}));
    ASSERT_TRUE(std::holds_alternative<JsonRpcNotification>(parsed));
    EXPECT_EQ(std::get<JsonRpcNotification>(parsed), notif);
}
