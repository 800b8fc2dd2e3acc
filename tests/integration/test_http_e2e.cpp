#include <gtest/gtest.h>
#include "sqlmcp/server.hpp"
#include "sqlmcp/error.hpp"

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace sqlmcp;

class HttpE2ETest : public ::testing::Test {
protected:
    std::unique_ptr<McpServer> server_;
    std::unique_ptr<httplib::Client> client_;
    std::thread server_thread_;

    void start(Settings settings) {
        settings.host = "127.0.0.1";
        settings.port = 0;
        McpServer::Options opts;
        opts.settings = std::move(settings);
        server_ = std::make_unique<McpServer>(std::move(opts));

        server_thread_ = std::thread([this]() { server_->start(); });
        ASSERT_TRUE(server_->wait_until_ready(std::chrono::seconds(5)));

        client_ = std::make_unique<httplib::Client>("127.0.0.1", server_->port());
        client_->set_read_timeout(5, 0);
    }

    void start() { start(Settings{}); }

    void TearDown() override {
        if (server_) server_->shutdown();
        if (server_thread_.joinable()) server_thread_.join();
    }

    nlohmann::json rpc(const std::string& body, int expected_status = 200) {
        auto res = client_->Post("/", body, "application/json");
        EXPECT_TRUE(res);
        if (!res) return nullptr;
        EXPECT_EQ(res->status, expected_status);
        return nlohmann::json::parse(res->body);
    }
};

TEST_F(HttpE2ETest, Initialize) {
    start();
    auto j = rpc(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"clientInfo":{"name":"test-client"}}})");
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 1);
    const auto& caps = j["result"]["capabilities"];
    EXPECT_EQ(caps["serverName"], "sqlmcp");
    EXPECT_EQ(caps["serverVersion"], "1.0.0");
    EXPECT_EQ(caps["tools"].size(), 4u);
    EXPECT_EQ(caps["capabilities"]["supportsNotebooks"], true);
}

TEST_F(HttpE2ETest, QueryWithoutInitialize) {
    start();
    auto j = rpc(R"({"jsonrpc":"2.0","id":2,"method":"query","params":{"query":"SELECT * FROM users"}})");
    EXPECT_EQ(j["id"], 2);
    EXPECT_EQ(j["result"]["columns"], nlohmann::json::array({"id", "name"}));
    EXPECT_EQ(j["result"]["rows"].size(), 2u);
}

TEST_F(HttpE2ETest, MissingParameter) {
    start();
    auto j = rpc(R"({"jsonrpc":"2.0","id":3,"method":"discover_data"})");
    EXPECT_EQ(j["id"], 3);
    EXPECT_EQ(j["error"]["code"], error::InvalidParams);
    EXPECT_EQ(j["error"]["data"]["detail"], "Missing required parameter: table");
}

TEST_F(HttpE2ETest, UnknownMethod) {
    start();
    auto j = rpc(R"({"jsonrpc":"2.0","id":4,"method":"vacuum"})");
    EXPECT_EQ(j["error"]["code"], error::MethodNotFound);
    EXPECT_EQ(j["error"]["data"]["method"], "vacuum");
}

TEST_F(HttpE2ETest, ParseErrorIs400WithRecoveredId) {
    start();
    auto j = rpc(R"({"id": 7, "method": })", 400);
    EXPECT_EQ(j["id"], 7);
    EXPECT_EQ(j["error"]["code"], error::ParseError);
}

TEST_F(HttpE2ETest, Health) {
    Settings s;
    s.server_info.name = "warehouse";
    s.server_info.version = "9.9.9";
    start(s);
    auto res = client_->Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto j = nlohmann::json::parse(res->body);
    EXPECT_EQ(j["status"], "ok");
    EXPECT_EQ(j["service"], "warehouse");
    EXPECT_EQ(j["version"], "9.9.9");
    EXPECT_FALSE(j["timestamp"].get<std::string>().empty());
}

TEST_F(HttpE2ETest, MetricsCountRequests) {
    start();
    rpc(R"({"jsonrpc":"2.0","id":1,"method":"list_tables"})");
    rpc(R"({"jsonrpc":"2.0","id":2,"method":"list_tables"})");
    auto res = client_->Get("/metrics");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_NE(res->body.find("sqlmcp_request_count{method=\"POST\",endpoint=\"/\"} 2"), std::string::npos);
    EXPECT_NE(res->body.find("sqlmcp_dispatch_count{method=\"list_tables\",outcome=\"ok\"} 2"), std::string::npos);
    EXPECT_EQ(server_->metrics().request_count("POST", "/"), 2u);
}

TEST_F(HttpE2ETest, OriginCheck) {
    Settings s;
    s.allowed_origins = {"http://good.example"};
    start(s);

    httplib::Headers bad = {{"Origin", "http://evil.example"}};
    auto rejected = client_->Post("/", bad, R"({"jsonrpc":"2.0","id":1,"method":"list_tables"})",
                                  "application/json");
    ASSERT_TRUE(rejected);
    EXPECT_EQ(rejected->status, 403);
    EXPECT_EQ(nlohmann::json::parse(rejected->body)["error"]["code"], error::InvalidRequest);

    httplib::Headers good = {{"Origin", "http://good.example"}};
    auto accepted = client_->Post("/", good, R"({"jsonrpc":"2.0","id":1,"method":"list_tables"})",
                                  "application/json");
    ASSERT_TRUE(accepted);
    EXPECT_EQ(accepted->status, 200);
    EXPECT_EQ(accepted->get_header_value("Access-Control-Allow-Origin"), "http://good.example");
}

TEST_F(HttpE2ETest, Preflight) {
    start();
    httplib::Headers headers = {{"Origin", "http://any.example"}};
    auto res = client_->Options("/", headers);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 204);
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
}

TEST_F(HttpE2ETest, ConcurrentCalls) {
    start();
    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([this, i, &ok] {
            httplib::Client c("127.0.0.1", server_->port());
            auto body = nlohmann::json{{"jsonrpc", "2.0"}, {"id", i}, {"method", "list_tables"}}.dump();
            auto res = c.Post("/", body, "application/json");
            if (res && res->status == 200 && nlohmann::json::parse(res->body)["id"] == i) ++ok;
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(ok.load(), 8);
}

TEST_F(HttpE2ETest, GzipWhenAccepted) {
    start();
    client_->set_decompress(false);
    httplib::Headers gzip = {{"Accept-Encoding", "gzip"}};

    auto metrics = client_->Get("/metrics", gzip);
    ASSERT_TRUE(metrics);
    EXPECT_EQ(metrics->status, 200);
    EXPECT_EQ(metrics->get_header_value("Content-Encoding"), "gzip");

    auto call = client_->Post("/", gzip, R"({"jsonrpc":"2.0","id":1,"method":"list_tables"})", "application/json");
    ASSERT_TRUE(call);
    EXPECT_EQ(call->get_header_value("Content-Encoding"), "gzip");

    // Identity encoding keeps the body plain
    httplib::Client raw("127.0.0.1", server_->port());
    raw.set_decompress(false);
    httplib::Headers identity = {{"Accept-Encoding", "identity"}};
    auto plain = raw.Post("/", identity, R"({"jsonrpc":"2.0","id":2,"method":"list_tables"})", "application/json");
    ASSERT_TRUE(plain);
    EXPECT_FALSE(plain->has_header("Content-Encoding"));
    EXPECT_EQ(nlohmann::json::parse(plain->body)["id"], 2);
}

TEST_F(HttpE2ETest, DecompressedReplyParses) {
    start();
    auto res = client_->Post("/", R"({"jsonrpc":"2.0","id":3,"method":"list_tables"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(nlohmann::json::parse(res->body)["result"]["tables"].size(), 3u);
}

namespace {

McpServer::Options local_server_options() {
    McpServer::Options opts;
    opts.settings.host = "127.0.0.1";
    opts.settings.port = 0;
    opts.settings.max_connections = 4;
    return opts;
}

} // anonymous namespace

TEST(HttpShutdown, ImmediatelyAfterStart) {
    for (int i = 0; i < 20; ++i) {
        McpServer server(local_server_options());
        std::thread t([&server] { server.start(); });
        server.shutdown();
        t.join();
        EXPECT_FALSE(server.is_running());
    }
}

TEST(HttpShutdown, BeforeStartMakesStartReturn) {
    McpServer server(local_server_options());
    server.shutdown();
    server.start();
    EXPECT_FALSE(server.is_running());
}

TEST(HttpShutdown, AfterReady) {
    McpServer server(local_server_options());
    std::thread t([&server] { server.start(); });
    ASSERT_TRUE(server.wait_until_ready(std::chrono::seconds(5)));
    server.shutdown();
    t.join();
    EXPECT_FALSE(server.is_running());
}
