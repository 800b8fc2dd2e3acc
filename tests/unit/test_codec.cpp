#include <gtest/gtest.h>
#include "sqlmcp/codec.hpp"
#include "sqlmcp/error.hpp"
#include <limits>
#include <string>

using namespace sqlmcp;

// ---- Parse tests ----

TEST(CodecParse, ValidRequest) {
    auto req = Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"list_tables","params":{}})");
    EXPECT_EQ(std::get<int64_t>(req.id), 1);
    EXPECT_EQ(req.method, "list_tables");
    EXPECT_TRUE(req.params.is_object());
    EXPECT_TRUE(req.params.empty());
}

TEST(CodecParse, ValidRequestStringId) {
    auto req = Codec::parse(R"({"jsonrpc":"2.0","id":"abc-123","method":"query","params":{"query":"SELECT 1"}})");
    EXPECT_EQ(std::get<std::string>(req.id), "abc-123");
    EXPECT_EQ(req.params["query"], "SELECT 1");
}

TEST(CodecParse, MissingParamsBecomesEmptyObject) {
    auto req = Codec::parse(R"({"jsonrpc":"2.0","id":2,"method":"discover_data"})");
    EXPECT_TRUE(req.params.is_object());
    EXPECT_TRUE(req.params.empty());
}

TEST(CodecParse, NullParamsBecomesEmptyObject) {
    auto req = Codec::parse(R"({"jsonrpc":"2.0","id":2,"method":"discover_data","params":null})");
    EXPECT_TRUE(req.params.is_object());
}

TEST(CodecParse, MissingJsonrpcAccepted) {
    auto req = Codec::parse(R"({"id":9,"method":"shutdown"})");
    EXPECT_EQ(req.method, "shutdown");
}

TEST(CodecParse, NestedParams) {
    auto req = Codec::parse(R"({"id":1,"method":"initialize","params":{"clientInfo":{"name":"c","tags":[1,2.5,true,null]}}})");
    const auto& tags = req.params["clientInfo"]["tags"];
    ASSERT_EQ(tags.size(), 4u);
    EXPECT_EQ(tags[0], 1);
    EXPECT_DOUBLE_EQ(tags[1].get<double>(), 2.5);
    EXPECT_EQ(tags[2], true);
    EXPECT_TRUE(tags[3].is_null());
}

TEST(CodecParse, InvalidJsonThrows) {
    EXPECT_THROW(Codec::parse("not json"), McpParseError);
    EXPECT_THROW(Codec::parse(R"({"id":1,"method":)"), McpParseError);
}

TEST(CodecParse, EmptyInputThrows) {
    EXPECT_THROW(Codec::parse(""), McpParseError);
}

TEST(CodecParse, NonObjectThrows) {
    EXPECT_THROW(Codec::parse("[1,2,3]"), McpParseError);
    EXPECT_THROW(Codec::parse("42"), McpParseError);
}

TEST(CodecParse, WrongVersionThrows) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"1.0","id":1,"method":"query"})"), McpParseError);
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":2,"id":1,"method":"query"})"), McpParseError);
}

TEST(CodecParse, MissingIdThrows) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","method":"query"})"), McpParseError);
}

TEST(CodecParse, BadIdTypeThrows) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1.5,"method":"query"})"), McpParseError);
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":null,"method":"query"})"), McpParseError);
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":{},"method":"query"})"), McpParseError);
}

TEST(CodecParse, MissingOrBadMethodThrows) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1})"), McpParseError);
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":5})"), McpParseError);
}

TEST(CodecParse, NonObjectParamsThrows) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"query","params":[1]})"), McpParseError);
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"query","params":"x"})"), McpParseError);
}

namespace {

std::string nested_query(size_t depth) {
    return R"({"jsonrpc":"2.0","id":5,"method":"query","params":{"query":"x","a":)"
           + std::string(depth, '[') + std::string(depth, ']') + "}}";
}

} // anonymous namespace

TEST(CodecParse, ModerateNestingAccepted) {
    auto req = Codec::parse(nested_query(100));
    EXPECT_TRUE(req.params["a"].is_array());
}

TEST(CodecParse, DeepNestingThrows) {
    EXPECT_THROW(Codec::parse(nested_query(100000)), McpParseError);
    EXPECT_THROW(Codec::parse(nested_query(600)), McpParseError);
}

TEST(CodecParse, UnsignedIdBeyondInt64Throws) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":18446744073709551615,"method":"list_tables"})"),
                 McpParseError);
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":9223372036854775808,"method":"list_tables"})"),
                 McpParseError);
}

TEST(CodecParse, Int64BoundaryIdsKept) {
    auto max = Codec::parse(R"({"jsonrpc":"2.0","id":9223372036854775807,"method":"list_tables"})");
    EXPECT_EQ(std::get<int64_t>(max.id), std::numeric_limits<int64_t>::max());
    auto min = Codec::parse(R"({"jsonrpc":"2.0","id":-9223372036854775808,"method":"list_tables"})");
    EXPECT_EQ(std::get<int64_t>(min.id), std::numeric_limits<int64_t>::min());
}

TEST(CodecRecoverId, OutOfRangeIdNotRecovered) {
    EXPECT_FALSE(Codec::recover_id(R"({"id":18446744073709551615,"method":"x"})").has_value());
}

// ---- Id recovery ----

TEST(CodecRecoverId, IntegerIdFromBrokenBody) {
    auto id = Codec::recover_id(R"({"id": 7, "method": })");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(std::get<int64_t>(*id), 7);
}

TEST(CodecRecoverId, StringIdFromInvalidRequest) {
    auto id = Codec::recover_id(R"({"jsonrpc":"2.0","id":"r-1","method":42})");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(std::get<std::string>(*id), "r-1");
}

TEST(CodecRecoverId, NothingToRecover) {
    EXPECT_FALSE(Codec::recover_id("").has_value());
    EXPECT_FALSE(Codec::recover_id("garbage").has_value());
    EXPECT_FALSE(Codec::recover_id("[1,2]").has_value());
    EXPECT_FALSE(Codec::recover_id(R"({"method":"query"})").has_value());
    EXPECT_FALSE(Codec::recover_id(R"({"id":null})").has_value());
}

// ---- Responses ----

TEST(CodecResponse, EncodeResult) {
    auto s = Codec::encode_result(RequestId{int64_t{1}}, nlohmann::json{{"tables", nlohmann::json::array()}});
    auto j = nlohmann::json::parse(s);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 1);
    EXPECT_TRUE(j["result"]["tables"].is_array());
}

TEST(CodecResponse, EncodeErrorWithData) {
    auto s = Codec::encode_error(RequestId{std::string("a")}, error::InvalidParams, "Invalid params",
                                 nlohmann::json{{"detail", "Missing required parameter: table"}});
    auto j = nlohmann::json::parse(s);
    EXPECT_EQ(j["id"], "a");
    EXPECT_EQ(j["error"]["code"], -32602);
    EXPECT_EQ(j["error"]["data"]["detail"], "Missing required parameter: table");
}

TEST(CodecResponse, EncodeErrorNullId) {
    auto j = nlohmann::json::parse(Codec::encode_error(std::nullopt, error::ParseError, "Parse error"));
    EXPECT_TRUE(j["id"].is_null());
    EXPECT_FALSE(j["error"].contains("data"));
}

TEST(CodecResponse, ParseResponse) {
    auto resp = Codec::parse_response(R"({"jsonrpc":"2.0","id":4,"result":null})");
    EXPECT_TRUE(resp.is_well_formed());
    EXPECT_TRUE(resp.result->is_null());

    auto err = Codec::parse_response(R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"Parse error"}})");
    EXPECT_FALSE(err.id.has_value());
    EXPECT_EQ(err.error->code, -32700);
}

TEST(CodecResponse, ParseResponseRejectsAmbiguous) {
    EXPECT_THROW(Codec::parse_response(R"({"jsonrpc":"2.0","id":1})"), McpParseError);
    EXPECT_THROW(Codec::parse_response(R"({"jsonrpc":"2.0","id":1,"result":1,"error":{"code":1,"message":"x"}})"),
                 McpParseError);
    EXPECT_THROW(Codec::parse_response(R"({"id":1,"result":1})"), McpParseError);
}

TEST(CodecRoundtrip, Request) {
    JsonRpcRequest req{RequestId{int64_t{11}}, "discover_data", nlohmann::json{{"table", "users"}}};
    EXPECT_EQ(Codec::parse(Codec::serialize(req)), req);
}
