#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sqlmcp {

// ---------- Server description ----------

struct CapabilityFlags {
    std::vector<std::string> supported_languages{"sql", "python"};
    bool supports_notebooks = true;
    bool supports_inline_completions = true;

    bool operator==(const CapabilityFlags& o) const {
        return supported_languages == o.supported_languages
               && supports_notebooks == o.supports_notebooks
               && supports_inline_completions == o.supports_inline_completions;
    }
};

struct ServerInfo {
    std::string name;
    std::string version;
    CapabilityFlags capabilities;

    bool operator==(const ServerInfo& o) const {
        return name == o.name && version == o.version && capabilities == o.capabilities;
    }
};

// ---------- Tool ----------

struct ToolDefinition {
    std::string name;
    std::string description;
    /// JSON-Schema object: "type", "properties", optional "required".
    nlohmann::json parameters = nlohmann::json{{"type", "object"},
                                               {"properties", nlohmann::json::object()}};

    bool operator==(const ToolDefinition& o) const {
        return name == o.name && description == o.description && parameters == o.parameters;
    }
};

// ---------- Backend results ----------

struct ColumnInfo {
    std::string name;
    std::string type;

    bool operator==(const ColumnInfo& o) const {
        return name == o.name && type == o.type;
    }
};

struct TableSchema {
    std::vector<ColumnInfo> columns;

    bool operator==(const TableSchema& o) const { return columns == o.columns; }
};

struct PreparedQuery {
    bool prepared = false;
    nlohmann::json parameters = nlohmann::json::array();

    bool operator==(const PreparedQuery& o) const {
        return prepared == o.prepared && parameters == o.parameters;
    }
};

struct QueryResult {
    std::vector<std::string> columns;
    std::vector<std::vector<nlohmann::json>> rows;

    bool operator==(const QueryResult& o) const {
        return columns == o.columns && rows == o.rows;
    }
};

// ---------- JSON conversions ----------

void to_json(nlohmann::json& j, const CapabilityFlags& c);
void from_json(const nlohmann::json& j, CapabilityFlags& c);

void to_json(nlohmann::json& j, const ToolDefinition& t);
void from_json(const nlohmann::json& j, ToolDefinition& t);

void to_json(nlohmann::json& j, const ColumnInfo& c);
void from_json(const nlohmann::json& j, ColumnInfo& c);

void to_json(nlohmann::json& j, const TableSchema& s);
void from_json(const nlohmann::json& j, TableSchema& s);

void to_json(nlohmann::json& j, const PreparedQuery& p);
void from_json(const nlohmann::json& j, PreparedQuery& p);

void to_json(nlohmann::json& j, const QueryResult& r);
void from_json(const nlohmann::json& j, QueryResult& r);

} // namespace sqlmcp
