/// SQL tool server over an in-memory table catalog.
///
/// Tables are registered up front; query answers "SELECT * FROM <table>"
/// and rejects everything else.

#include <sqlmcp/sqlmcp.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

namespace {

struct Table {
    sqlmcp::TableSchema schema;
    std::vector<std::vector<nlohmann::json>> rows;
};

class MemoryBackend : public sqlmcp::IBackend {
public:
    void add_table(const std::string& name, Table table) {
        std::lock_guard<std::mutex> lock(mutex_);
        tables_[name] = std::move(table);
    }

    std::vector<std::string> list_tables() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> names;
        for (const auto& [name, table] : tables_) names.push_back(name);
        return names;
    }

    sqlmcp::TableSchema discover_data(const std::string& table) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookup(table).schema;
    }

    sqlmcp::PreparedQuery prepare_query(const std::string& query) override {
        (void)target_of(query);
        return sqlmcp::PreparedQuery{true, nlohmann::json::array()};
    }

    sqlmcp::QueryResult query(const std::string& query) override {
        const auto name = target_of(query);
        std::lock_guard<std::mutex> lock(mutex_);
        const auto& table = lookup(name);
        sqlmcp::QueryResult result;
        for (const auto& col : table.schema.columns) result.columns.push_back(col.name);
        result.rows = table.rows;
        return result;
    }

private:
    const Table& lookup(const std::string& name) const {
        auto it = tables_.find(name);
        if (it == tables_.end()) throw sqlmcp::McpBackendError("Unknown table: " + name);
        return it->second;
    }

    // "select * from name" -> "name"
    static std::string target_of(const std::string& query) {
        std::istringstream in(query);
        std::vector<std::string> words;
        for (std::string w; in >> w;) words.push_back(w);
        auto lower = [](std::string s) {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
            return s;
        };
        if (words.size() != 4 || lower(words[0]) != "select" || words[1] != "*" || lower(words[2]) != "from") {
            throw sqlmcp::McpBackendError("Unsupported query: " + query);
        }
        auto name = words[3];
        if (!name.empty() && name.back() == ';') name.pop_back();
        return name;
    }

    std::mutex mutex_;
    std::map<std::string, Table> tables_;
};

} // anonymous namespace

int main() {
    auto backend = std::make_shared<MemoryBackend>();
    backend->add_table("cities", Table{
        sqlmcp::TableSchema{{{"id", "integer"}, {"name", "string"}, {"population", "integer"}}},
        {
            std::vector<nlohmann::json>{1, "Lisbon", 545000},
            std::vector<nlohmann::json>{2, "Oslo", 709000},
        }
    });
    backend->add_table("rivers", Table{
        sqlmcp::TableSchema{{{"name", "string"}, {"length_km", "integer"}}},
        {
            std::vector<nlohmann::json>{"Tagus", 1007},
            std::vector<nlohmann::json>{"Glomma", 621},
        }
    });

    try {
        sqlmcp::McpServer::Options opts;
        opts.settings = sqlmcp::Settings::from_env();
        opts.settings.server_info.name = "memory-sql";
        sqlmcp::LogSettings log;
        log.level = opts.settings.log_level;
        log.file = opts.settings.log_file;
        log.logger_name = opts.settings.server_info.name;
        sqlmcp::init_logging(log);
        opts.backend = backend;

        sqlmcp::McpServer server(std::move(opts));
        server.start();
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
