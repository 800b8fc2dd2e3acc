#include <gtest/gtest.h>
#include "sqlmcp/types.hpp"

using namespace sqlmcp;

TEST(Types, CapabilityFlagsDefaults) {
    nlohmann::json j = CapabilityFlags{};
    EXPECT_EQ(j["supportedLanguages"], nlohmann::json::array({"sql", "python"}));
    EXPECT_EQ(j["supportsNotebooks"], true);
    EXPECT_EQ(j["supportsInlineCompletions"], true);
}

TEST(Types, CapabilityFlagsFromPartialJson) {
    auto flags = nlohmann::json::parse(R"({"supportedLanguages":["sql"]})").get<CapabilityFlags>();
    EXPECT_EQ(flags.supported_languages, std::vector<std::string>{"sql"});
    EXPECT_FALSE(flags.supports_notebooks);
}

TEST(Types, ToolDefinitionDefaultParameters) {
    ToolDefinition def;
    def.name = "list_tables";
    def.description = "List all available tables";
    nlohmann::json j = def;
    EXPECT_EQ(j["name"], "list_tables");
    EXPECT_EQ(j["parameters"]["type"], "object");
    EXPECT_TRUE(j["parameters"]["properties"].empty());
    EXPECT_EQ(j.get<ToolDefinition>(), def);
}

TEST(Types, TableSchemaShape) {
    TableSchema schema{{{"id", "integer"}, {"name", "string"}}};
    nlohmann::json j = schema;
    ASSERT_EQ(j["columns"].size(), 2u);
    EXPECT_EQ(j["columns"][0]["name"], "id");
    EXPECT_EQ(j["columns"][0]["type"], "integer");
    EXPECT_EQ(j.get<TableSchema>(), schema);
}

TEST(Types, PreparedQueryShape) {
    nlohmann::json j = PreparedQuery{true, nlohmann::json::array()};
    EXPECT_EQ(j["prepared"], true);
    EXPECT_TRUE(j["parameters"].is_array());
    EXPECT_TRUE(j["parameters"].empty());
}

TEST(Types, QueryResultShape) {
    QueryResult r;
    r.columns = {"id", "name"};
    r.rows.push_back(std::vector<nlohmann::json>{1, "Example"});
    nlohmann::json j = r;
    EXPECT_EQ(j["columns"], nlohmann::json::array({"id", "name"}));
    EXPECT_EQ(j["rows"][0][0], 1);
    EXPECT_EQ(j["rows"][0][1], "Example");
    EXPECT_EQ(j.get<QueryResult>(), r);
}
