#include "sqlmcp/backend.hpp"

namespace sqlmcp {

std::vector<std::string> StubBackend::list_tables() {
    return {"users", "products", "orders"};
}

TableSchema StubBackend::discover_data(const std::string& /*table*/) {
    return TableSchema{{
        {"id", "integer"},
        {"name", "string"},
        {"created_at", "timestamp"}
    }};
}

PreparedQuery StubBackend::prepare_query(const std::string& /*query*/) {
    return PreparedQuery{true, nlohmann::json::array()};
}

QueryResult StubBackend::query(const std::string& /*query*/) {
    QueryResult result;
    result.columns = {"id", "name"};
    result.rows.push_back(std::vector<nlohmann::json>{1, "Example"});
    result.rows.push_back(std::vector<nlohmann::json>{2, "Test"});
    return result;
}

} // namespace sqlmcp
