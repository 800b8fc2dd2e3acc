#include "sqlmcp/types.hpp"

namespace sqlmcp {

// ---------- CapabilityFlags ----------

void to_json(nlohmann::json& j, const CapabilityFlags& c) {
    j = {
        {"supportedLanguages", c.supported_languages},
        {"supportsNotebooks", c.supports_notebooks},
        {"supportsInlineCompletions", c.supports_inline_completions}
    };
}

void from_json(const nlohmann::json& j, CapabilityFlags& c) {
    c.supported_languages = j.value("supportedLanguages", std::vector<std::string>{});
    c.supports_notebooks = j.value("supportsNotebooks", false);
    c.supports_inline_completions = j.value("supportsInlineCompletions", false);
}

// ---------- ToolDefinition ----------

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"description", t.description}, {"parameters", t.parameters}};
}

void from_json(const nlohmann::json& j, ToolDefinition& t) {
    t.name = j.at("name").get<std::string>();
    t.description = j.value("description", std::string{});
    if (j.contains("parameters")) t.parameters = j.at("parameters");
}

// ---------- ColumnInfo / TableSchema ----------

void to_json(nlohmann::json& j, const ColumnInfo& c) {
    j = {{"name", c.name}, {"type", c.type}};
}

void from_json(const nlohmann::json& j, ColumnInfo& c) {
    c.name = j.at("name").get<std::string>();
    c.type = j.at("type").get<std::string>();
}

void to_json(nlohmann::json& j, const TableSchema& s) {
    j = {{"columns", s.columns}};
}

void from_json(const nlohmann::json& j, TableSchema& s) {
    s.columns = j.at("columns").get<std::vector<ColumnInfo>>();
}

// ---------- PreparedQuery ----------

void to_json(nlohmann::json& j, const PreparedQuery& p) {
    j = {{"prepared", p.prepared}, {"parameters", p.parameters}};
}

void from_json(const nlohmann::json& j, PreparedQuery& p) {
    p.prepared = j.at("prepared").get<bool>();
    p.parameters = j.value("parameters", nlohmann::json::array());
}

// ---------- QueryResult ----------

void to_json(nlohmann::json& j, const QueryResult& r) {
    j = {{"columns", r.columns}, {"rows", r.rows}};
}

void from_json(const nlohmann::json& j, QueryResult& r) {
    r.columns = j.at("columns").get<std::vector<std::string>>();
    r.rows = j.at("rows").get<std::vector<std::vector<nlohmann::json>>>();
}

} // namespace sqlmcp
