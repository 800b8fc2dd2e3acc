#include "sqlmcp/tool_registry.hpp"
#include <algorithm>
#include <stdexcept>

namespace sqlmcp {

namespace {

ToolDefinition make_tool(std::string name, std::string description,
                         const char* param = nullptr, const char* param_description = nullptr) {
    ToolDefinition def;
    def.name = std::move(name);
    def.description = std::move(description);
    if (param) {
        def.parameters = {
            {"type", "object"},
            {"properties", {
                {param, {{"type", "string"}, {"description", param_description}}}
            }},
            {"required", nlohmann::json::array({param})}
        };
    }
    return def;
}

bool is_blank(const nlohmann::json& value) {
    if (value.is_null()) return true;
    if (value.is_string()) return value.get_ref<const std::string&>().empty();
    return false;
}

} // anonymous namespace

void ToolRegistry::add_tool(ToolDefinition def) {
    if (def.name.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }
    if (find(def.name)) {
        throw std::invalid_argument("Duplicate tool name: " + def.name);
    }
    tools_.push_back(std::move(def));
}

const ToolDefinition* ToolRegistry::find(const std::string& name) const {
    auto it = std::find_if(tools_.begin(), tools_.end(),
        [&name](const ToolDefinition& t) { return t.name == name; });
    return it == tools_.end() ? nullptr : &*it;
}

nlohmann::json ToolRegistry::handshake(const ServerInfo& info) const {
    return {
        {"capabilities", {
            {"serverName", info.name},
            {"serverVersion", info.version},
            {"tools", tools_},
            {"capabilities", info.capabilities}
        }}
    };
}

std::optional<std::string> ToolRegistry::validate_arguments(const std::string& tool,
                                                            const nlohmann::json& params) const {
    const auto* def = find(tool);
    if (!def) return std::nullopt;

    auto required = def->parameters.find("required");
    if (required == def->parameters.end() || !required->is_array()) return std::nullopt;

    const auto properties = def->parameters.value("properties", nlohmann::json::object());
    for (const auto& name_j : *required) {
        const auto name = name_j.get<std::string>();
        auto value = params.is_object() ? params.find(name) : params.end();
        if (!params.is_object() || value == params.end() || is_blank(*value)) {
            return "Missing required parameter: " + name;
        }
        auto prop = properties.find(name);
        if (prop != properties.end() && prop->value("type", "") == "string" && !value->is_string()) {
            return "Invalid parameter type: " + name + " must be a string";
        }
    }
    return std::nullopt;
}

std::shared_ptr<const ToolRegistry> ToolRegistry::builtin() {
    auto registry = std::make_shared<ToolRegistry>();
    registry->add_tool(make_tool("list_tables", "List all available tables"));
    registry->add_tool(make_tool("discover_data", "Discover data in tables",
                                 "table", "Table name to discover"));
    registry->add_tool(make_tool("prepare_query", "Prepare a SQL query",
                                 "query", "SQL query to prepare"));
    registry->add_tool(make_tool("query", "Execute a SQL query",
                                 "query", "SQL query to execute"));
    return registry;
}

} // namespace sqlmcp
