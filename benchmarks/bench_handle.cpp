#include <benchmark/benchmark.h>
#include "mcpecho/server.hpp"
#include "mcpecho/echo_tool.hpp"
#include <memory>
#include <string>

using namespace mcpecho;

static std::unique_ptr<McpServer> make_server() {
    auto server = std::make_unique<McpServer>();
    add_echo_tool(*server);
    return server;
}

static void BM_HandleInitialize(benchmark::State& state) {
    auto server = make_server();
    const std::string line = R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})";
    for (auto _ : state) {
        auto resp = server->handle_line(line);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_HandleInitialize);

static void BM_HandleEchoCall(benchmark::State& state) {
    auto server = make_server();
    const std::string line =
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"echo","arguments":{"message":"hi"}}})";
    for (auto _ : state) {
        auto resp = server->handle_line(line);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_HandleEchoCall);

static void BM_HandleUnknownMethod(benchmark::State& state) {
    auto server = make_server();
    const std::string line = R"({"jsonrpc":"2.0","id":3,"method":"not_registered_method"})";
    for (auto _ : state) {
        auto resp = server->handle_line(line);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_HandleUnknownMethod);

static void BM_HandleNotification(benchmark::State& state) {
    auto server = make_server();
    const std::string line = R"({"jsonrpc":"2.0","method":"notifications/initialized"})";
    for (auto _ : state) {
        auto resp = server->handle_line(line);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_HandleNotification);

static void BM_HandleParseError(benchmark::State& state) {
    auto server = make_server();
    const std::string line = "{\"jsonrpc\":";
    for (auto _ : state) {
        auto resp = server->handle_line(line);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_HandleParseError);
