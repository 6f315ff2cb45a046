#include <benchmark/benchmark.h>
#include "mcplink/codec.hpp"
#include "mcplink/json_rpc.hpp"
#include <string>

using namespace mcplink;

static const std::string kPing =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"get_weather","arguments":{"location":"Warsaw","units":"celsius"}}})";

// tools/list response carrying `n` tool definitions.
static std::string make_large_response(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "A tool for doing something useful, number " + std::to_string(i)},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {
                    {"param1", {{"type", "string"}, {"description", "First parameter"}}},
                    {"param2", {{"type", "integer"}, {"description", "Second parameter"}}}
                }},
                {"required", {"param1"}}
            }}
        });
    }
    return nlohmann::json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", {{"tools", tools}}}}.dump();
}

static const std::string kLargeResponse = make_large_response(100);

// ---- Decode ----

static void BM_DecodePing(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::decode(kPing);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kPing.size());
}
BENCHMARK(BM_DecodePing);

static void BM_DecodeToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::decode(kToolCallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_DecodeToolCall);

// The result body is only scanned, never materialized.
static void BM_DecodeLargeResponse(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::decode(kLargeResponse);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kLargeResponse.size());
}
BENCHMARK(BM_DecodeLargeResponse);

static void BM_DecodeAndParseLargeResult(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::decode(kLargeResponse);
        auto result = std::get<JsonRpcResponse>(msg).result->parse();
        benchmark::DoNotOptimize(result);
    }
    state.SetBytesProcessed(state.iterations() * kLargeResponse.size());
}
BENCHMARK(BM_DecodeAndParseLargeResult);

static void BM_DecodeInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto msg = Codec::decode(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const RpcEnvelopeError& e) {
            benchmark::DoNotOptimize(e.code);
        }
    }
}
BENCHMARK(BM_DecodeInvalidJson);

// ---- Encode ----

static void BM_EncodePing(benchmark::State& state) {
    JsonRpcRequest req{RequestId{int64_t{1}}, "ping", RawJson("{}")};
    JsonRpcMessage msg = req;
    for (auto _ : state) {
        auto s = Codec::encode(msg);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_EncodePing);

static void BM_EncodeLargeResponse(benchmark::State& state) {
    auto msg = Codec::decode(kLargeResponse);
    for (auto _ : state) {
        auto s = Codec::encode(msg);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kLargeResponse.size());
}
BENCHMARK(BM_EncodeLargeResponse);

static void BM_RoundTrip(benchmark::State& state) {
    for (auto _ : state) {
        auto encoded = Codec::encode(Codec::decode(kToolCallRequest));
        benchmark::DoNotOptimize(encoded);
    }
}
BENCHMARK(BM_RoundTrip);
