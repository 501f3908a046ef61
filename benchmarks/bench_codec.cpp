#include <benchmark/benchmark.h>
#include "mcpecho/codec.hpp"
#include "mcpecho/json_rpc.hpp"
#include <string>

using namespace mcpecho;

static const std::string kInitializeRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","capabilities":{},"clientInfo":{"name":"bench","version":"1.0"}}})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"echo","arguments":{"message":"hello from the benchmark"}}})";

// Echo call carrying a large message
static std::string make_large_call(size_t message_size) {
    nlohmann::json req = {
        {"jsonrpc", "2.0"},
        {"id", 7},
        {"method", "tools/call"},
        {"params", {{"name", "echo"}, {"arguments", {{"message", std::string(message_size, 'x')}}}}}
    };
    return req.dump();
}

static const std::string kLargeCall = make_large_call(64 * 1024);

// ---- Parse benchmarks ----

static void BM_ParseInitialize(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kInitializeRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(kInitializeRequest.size()));
}
BENCHMARK(BM_ParseInitialize);

static void BM_ParseToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(kToolCallRequest.size()));
}
BENCHMARK(BM_ParseToolCall);

static void BM_ParseLargeCall(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kLargeCall);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(kLargeCall.size()));
}
BENCHMARK(BM_ParseLargeCall);

static void BM_ParseInvalid(benchmark::State& state) {
    const std::string garbage = "not json at all";
    for (auto _ : state) {
        try {
            auto j = Codec::parse_json(garbage);
            benchmark::DoNotOptimize(j);
        } catch (const McpParseError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_ParseInvalid);

// ---- Serialize benchmarks ----

static void BM_SerializeResponse(benchmark::State& state) {
    JsonRpcResponse resp;
    resp.id = 42;
    resp.result = nlohmann::json{{"content", {{{"type", "text"}, {"text", "Echo: hello"}}}}};
    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeResponse);
