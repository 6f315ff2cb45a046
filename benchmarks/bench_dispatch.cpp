#include <benchmark/benchmark.h>
#include "mcplink/log.hpp"
#include "mcplink/router.hpp"
#include "mcplink/server.hpp"
#include <string>
#include <vector>

using namespace mcplink;

static Router make_router(int n_methods) {
    Router::Builder builder;
    for (int i = 0; i < n_methods; ++i) {
        builder.on_request("method_" + std::to_string(i),
            [](const RawJson&, const CancellationToken&) {
                return nlohmann::json{{"result", "ok"}};
            });
    }
    builder.on_request("ping", [](const RawJson&, const CancellationToken&) {
        return nlohmann::json::object();
    });
    return builder.build();
}

static void BM_DispatchKnownMethod(benchmark::State& state) {
    auto router = make_router(1);
    JsonRpcMessage req = JsonRpcRequest{RequestId{int64_t{1}}, "ping", std::nullopt};
    for (auto _ : state) {
        auto result = router.dispatch(req);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_DispatchKnownMethod);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    auto router = make_router(1);
    JsonRpcMessage req = JsonRpcRequest{RequestId{int64_t{1}}, "not_registered_method", std::nullopt};
    for (auto _ : state) {
        auto result = router.dispatch(req);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_DispatchUnknownMethod);

static void BM_Dispatch100Methods(benchmark::State& state) {
    auto router = make_router(100);
    std::vector<JsonRpcMessage> requests;
    for (int i = 0; i < 100; ++i) {
        requests.push_back(JsonRpcRequest{RequestId{int64_t{i}}, "method_" + std::to_string(i), std::nullopt});
    }
    size_t i = 0;
    for (auto _ : state) {
        auto result = router.dispatch(requests[i % requests.size()]);
        benchmark::DoNotOptimize(result);
        ++i;
    }
}
BENCHMARK(BM_Dispatch100Methods);

static void BM_DispatchNotification(benchmark::State& state) {
    auto router = Router::Builder()
        .on_notification("notifications/initialized", [](const Notification&, const CancellationToken&) {})
        .build();
    JsonRpcMessage notif = JsonRpcNotification{"notifications/initialized", std::nullopt};
    for (auto _ : state) {
        auto result = router.dispatch(notif);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_DispatchNotification);

// Full line in, encoded line out, through the default server routes.
static void BM_ServerToolCallLine(benchmark::State& state) {
    log::set_level(spdlog::level::warn);
    auto server = Server::Builder().build();
    const std::string line =
        R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"echo","arguments":{"text":"hi"}}})";
    for (auto _ : state) {
        auto result = server.dispatch_line(line);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_ServerToolCallLine);
