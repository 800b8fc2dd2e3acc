#include <gtest/gtest.h>
#include "sqlmcp/tool_registry.hpp"
#include <stdexcept>

using namespace sqlmcp;

TEST(ToolRegistry, BuiltinTools) {
    auto registry = ToolRegistry::builtin();
    ASSERT_EQ(registry->size(), 4u);
    const auto& tools = registry->list_tools();
    EXPECT_EQ(tools[0].name, "list_tables");
    EXPECT_EQ(tools[1].name, "discover_data");
    EXPECT_EQ(tools[2].name, "prepare_query");
    EXPECT_EQ(tools[3].name, "query");
    EXPECT_EQ(tools[0].description, "List all available tables");
}

TEST(ToolRegistry, BuiltinSchemas) {
    auto registry = ToolRegistry::builtin();
    const auto* discover = registry->find("discover_data");
    ASSERT_NE(discover, nullptr);
    EXPECT_EQ(discover->parameters["required"], nlohmann::json::array({"table"}));
    EXPECT_EQ(discover->parameters["properties"]["table"]["type"], "string");

    const auto* list = registry->find("list_tables");
    ASSERT_NE(list, nullptr);
    EXPECT_FALSE(list->parameters.contains("required"));
    EXPECT_EQ(registry->find("drop_table"), nullptr);
}

TEST(ToolRegistry, RejectsDuplicateAndEmptyNames) {
    ToolRegistry registry;
    registry.add_tool(ToolDefinition{"a", "first"});
    EXPECT_THROW(registry.add_tool(ToolDefinition{"a", "again"}), std::invalid_argument);
    EXPECT_THROW(registry.add_tool(ToolDefinition{"", "nameless"}), std::invalid_argument);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(ToolRegistry, Handshake) {
    auto registry = ToolRegistry::builtin();
    ServerInfo info{"sqlmcp", "1.0.0", CapabilityFlags{}};
    auto j = registry->handshake(info);
    const auto& caps = j["capabilities"];
    EXPECT_EQ(caps["serverName"], "sqlmcp");
    EXPECT_EQ(caps["serverVersion"], "1.0.0");
    ASSERT_EQ(caps["tools"].size(), 4u);
    EXPECT_EQ(caps["tools"][3]["name"], "query");
    EXPECT_EQ(caps["capabilities"]["supportsNotebooks"], true);
}

TEST(ToolRegistry, ValidateArguments) {
    auto registry = ToolRegistry::builtin();
    EXPECT_FALSE(registry->validate_arguments("discover_data", {{"table", "users"}}).has_value());
    EXPECT_FALSE(registry->validate_arguments("list_tables", nlohmann::json::object()).has_value());

    auto missing = registry->validate_arguments("discover_data", nlohmann::json::object());
    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ(*missing, "Missing required parameter: table");

    auto empty = registry->validate_arguments("query", {{"query", ""}});
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ(*empty, "Missing required parameter: query");

    auto null_value = registry->validate_arguments("query", {{"query", nullptr}});
    ASSERT_TRUE(null_value.has_value());

    auto wrong_type = registry->validate_arguments("query", {{"query", 5}});
    ASSERT_TRUE(wrong_type.has_value());
    EXPECT_EQ(*wrong_type, "Invalid parameter type: query must be a string");
}

TEST(ToolRegistry, ValidateUnknownToolPasses) {
    ToolRegistry registry;
    EXPECT_FALSE(registry.validate_arguments("anything", nlohmann::json::object()).has_value());
}
