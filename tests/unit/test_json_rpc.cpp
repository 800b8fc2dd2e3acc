#include <gtest/gtest.h>
#include "sqlmcp/json_rpc.hpp"
#include "sqlmcp/version.hpp"
#include <nlohmann/json.hpp>
#include <limits>

using namespace sqlmcp;

TEST(JsonRpc, RequestIdToString) {
    EXPECT_EQ(to_string(RequestId{int64_t{42}}), "42");
    EXPECT_EQ(to_string(RequestId{std::string("abc")}), "\"abc\"");
    EXPECT_EQ(to_string(std::optional<RequestId>{}), "null");
}

TEST(JsonRpc, RequestIdFromJsonRejectsOtherTypes) {
    RequestId id;
    EXPECT_THROW(from_json(nlohmann::json(1.5), id), std::invalid_argument);
    EXPECT_THROW(from_json(nlohmann::json::array(), id), std::invalid_argument);
    from_json(nlohmann::json(7), id);
    EXPECT_EQ(std::get<int64_t>(id), 7);
}

TEST(JsonRpc, RequestIdFromJsonRejectsUnsignedOverflow) {
    RequestId id;
    EXPECT_THROW(from_json(nlohmann::json(std::numeric_limits<uint64_t>::max()), id), std::out_of_range);
    EXPECT_THROW(from_json(nlohmann::json(uint64_t{9223372036854775808ULL}), id), std::out_of_range);
    from_json(nlohmann::json(uint64_t{9223372036854775807ULL}), id);
    EXPECT_EQ(std::get<int64_t>(id), std::numeric_limits<int64_t>::max());
}

TEST(JsonRpc, ResultResponseSerialization) {
    auto resp = make_result(RequestId{int64_t{1}}, nlohmann::json{{"tables", {"a"}}});
    nlohmann::json j;
    to_json(j, resp);
    EXPECT_EQ(j["jsonrpc"], std::string(JSONRPC_VERSION));
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["result"]["tables"][0], "a");
    EXPECT_FALSE(j.contains("error"));
}

TEST(JsonRpc, ErrorResponseSerialization) {
    auto resp = make_error(RequestId{std::string("x")},
                           JsonRpcError{-32601, "Method not found", nlohmann::json{{"method", "nope"}}});
    nlohmann::json j;
    to_json(j, resp);
    EXPECT_EQ(j["id"], "x");
    EXPECT_EQ(j["error"]["code"], -32601);
    EXPECT_EQ(j["error"]["message"], "Method not found");
    EXPECT_EQ(j["error"]["data"]["method"], "nope");
    EXPECT_FALSE(j.contains("result"));
}

TEST(JsonRpc, MissingIdSerializesAsNull) {
    auto resp = make_error(std::nullopt, JsonRpcError{-32700, "Parse error", std::nullopt});
    nlohmann::json j;
    to_json(j, resp);
    ASSERT_TRUE(j.contains("id"));
    EXPECT_TRUE(j["id"].is_null());
    EXPECT_FALSE(j["error"].contains("data"));
}

TEST(JsonRpc, NullResultIsStillAResult) {
    auto resp = make_result(RequestId{int64_t{3}}, nullptr);
    EXPECT_TRUE(resp.is_well_formed());
    EXPECT_FALSE(resp.is_error());
    nlohmann::json j;
    to_json(j, resp);
    ASSERT_TRUE(j.contains("result"));
    EXPECT_TRUE(j["result"].is_null());
}

TEST(JsonRpc, RequestOmitsEmptyParams) {
    JsonRpcRequest req{RequestId{int64_t{5}}, "list_tables", nlohmann::json::object()};
    nlohmann::json j;
    to_json(j, req);
    EXPECT_EQ(j["method"], "list_tables");
    EXPECT_FALSE(j.contains("params"));
}

TEST(JsonRpc, ResponseFromJson) {
    auto j = nlohmann::json::parse(R"({"jsonrpc":"2.0","id":"q1","error":{"code":-32000,"message":"boom"}})");
    JsonRpcResponse resp;
    from_json(j, resp);
    ASSERT_TRUE(resp.id.has_value());
    EXPECT_EQ(std::get<std::string>(*resp.id), "q1");
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(resp.error->code, -32000);
    EXPECT_FALSE(resp.error->data.has_value());
}
