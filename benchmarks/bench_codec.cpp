#include <benchmark/benchmark.h>
#include "sqlmcp/codec.hpp"
#include "sqlmcp/json_rpc.hpp"
#include <string>

using namespace sqlmcp;

static const std::string kSmallRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"list_tables","params":{}})";

static const std::string kQueryRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"query","params":{"query":"SELECT id, name FROM users WHERE created_at > '2024-01-01' ORDER BY id"}})";

static const std::string kBrokenRequest = R"({"jsonrpc":"2.0","id":42,"method": )";

// Query result with N rows of four columns
static nlohmann::json make_large_result(int n) {
    nlohmann::json rows = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        rows.push_back({i, "user_" + std::to_string(i), "user" + std::to_string(i) + "@example.com", i * 1.5});
    }
    return {{"columns", {"id", "name", "email", "score"}}, {"rows", rows}};
}

static const nlohmann::json kLargeResult = make_large_result(1000);

// ---- Parse benchmarks ----

static void BM_ParseSmallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kSmallRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(kSmallRequest.size()));
}
BENCHMARK(BM_ParseSmallRequest);

static void BM_ParseQueryRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kQueryRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(kQueryRequest.size()));
}
BENCHMARK(BM_ParseQueryRequest);

static void BM_RecoverId(benchmark::State& state) {
    for (auto _ : state) {
        auto id = Codec::recover_id(kBrokenRequest);
        benchmark::DoNotOptimize(id);
    }
}
BENCHMARK(BM_RecoverId);

// ---- Encode benchmarks ----

static void BM_EncodeSmallResult(benchmark::State& state) {
    const nlohmann::json result = {{"tables", {"users", "products", "orders"}}};
    for (auto _ : state) {
        auto s = Codec::encode_result(RequestId{int64_t{1}}, result);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_EncodeSmallResult);

static void BM_EncodeLargeResult(benchmark::State& state) {
    for (auto _ : state) {
        auto s = Codec::encode_result(RequestId{int64_t{1}}, kLargeResult);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_EncodeLargeResult);

static void BM_EncodeError(benchmark::State& state) {
    for (auto _ : state) {
        auto s = Codec::encode_error(RequestId{int64_t{3}}, -32602, "Invalid params",
                                     nlohmann::json{{"detail", "Missing required parameter: table"}});
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_EncodeError);
