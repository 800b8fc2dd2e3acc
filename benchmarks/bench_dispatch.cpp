#include <benchmark/benchmark.h>
#include "sqlmcp/dispatcher.hpp"
#include "sqlmcp/router.hpp"
#include <memory>
#include <string>

using namespace sqlmcp;

// Router with N methods registered (returned via unique_ptr to avoid mutex copy)
static std::unique_ptr<Router> make_router(int n_methods) {
    auto router = std::make_unique<Router>();
    for (int i = 0; i < n_methods; ++i) {
        router->on_request("method_" + std::to_string(i),
            [](const nlohmann::json&, ClientContext&) -> HandlerResult {
                return nlohmann::json{{"result", "ok"}};
            });
    }
    router->on_request("list_tables", [](const nlohmann::json&, ClientContext&) -> HandlerResult {
        return nlohmann::json{{"tables", nlohmann::json::array()}};
    });
    return router;
}

static Dispatcher::Options dispatcher_options() {
    Dispatcher::Options opts;
    opts.server_info = ServerInfo{"bench", "1.0.0", CapabilityFlags{}};
    return opts;
}

static void BM_RouterKnownMethod(benchmark::State& state) {
    auto router = make_router(static_cast<int>(state.range(0)));
    ClientContext ctx;
    JsonRpcRequest req{RequestId{int64_t{1}}, "list_tables", nlohmann::json::object()};

    for (auto _ : state) {
        auto resp = router->dispatch(req, ctx);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_RouterKnownMethod)->Arg(1)->Arg(100)->Arg(1000);

static void BM_RouterUnknownMethod(benchmark::State& state) {
    auto router = make_router(100);
    ClientContext ctx;
    JsonRpcRequest req{RequestId{int64_t{1}}, "no_such_method", nlohmann::json::object()};

    for (auto _ : state) {
        auto resp = router->dispatch(req, ctx);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_RouterUnknownMethod);

// Full decode, validate, stub backend, encode path
static void BM_HandleQuery(benchmark::State& state) {
    Dispatcher dispatcher(nullptr, std::make_shared<StubBackend>(), dispatcher_options());
    ClientContext ctx;
    const std::string body =
        R"({"jsonrpc":"2.0","id":2,"method":"query","params":{"query":"SELECT * FROM users"}})";

    for (auto _ : state) {
        auto reply = dispatcher.handle(body, ctx);
        benchmark::DoNotOptimize(reply);
    }
}
BENCHMARK(BM_HandleQuery);

static void BM_HandleInvalidParams(benchmark::State& state) {
    Dispatcher dispatcher(nullptr, std::make_shared<StubBackend>(), dispatcher_options());
    ClientContext ctx;
    const std::string body = R"({"jsonrpc":"2.0","id":3,"method":"discover_data"})";

    for (auto _ : state) {
        auto reply = dispatcher.handle(body, ctx);
        benchmark::DoNotOptimize(reply);
    }
}
BENCHMARK(BM_HandleInvalidParams);
