#include <benchmark/benchmark.h>
#include "foundry/codec.hpp"
#include "foundry/json_rpc.hpp"
#include <string>
#include <vector>

using namespace foundry;

// Liveness probe (~50 bytes)
static const std::string kPing =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

// Typical call forwarded by the router
static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"search_docs","arguments":{"query":"deployment checklist","limit":10}}})";

static const std::string kToolCallResult =
    R"({"jsonrpc":"2.0","id":42,"result":{"content":[{"type":"text","text":"3 documents matched"}],"structuredContent":{"hits":[1,2,3]},"isError":false}})";

// One tools/list page with N tools
static std::string make_catalog_page(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "Looks something up in the project store, variant " + std::to_string(i)},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {
                    {"query", {{"type", "string"}, {"description", "Search text"}}},
                    {"limit", {{"type", "integer"}, {"minimum", 1}}}
                }},
                {"required", {"query"}}
            }}
        });
    }
    nlohmann::json resp = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"result", {{"tools", tools}, {"nextCursor", "100"}}}
    };
    return resp.dump();
}

static const std::string kCatalogPage = make_catalog_page(100);

// ---- Parse ----

static void BM_ParsePing(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kPing);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kPing.size());
}
BENCHMARK(BM_ParsePing)->MinTime(1.0);

static void BM_ParseToolCallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_ParseToolCallRequest)->MinTime(1.0);

static void BM_ParseToolCallResult(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCallResult);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallResult.size());
}
BENCHMARK(BM_ParseToolCallResult)->MinTime(1.0);

static void BM_ParseCatalogPage(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kCatalogPage);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kCatalogPage.size());
}
BENCHMARK(BM_ParseCatalogPage)->MinTime(1.0);

static void BM_ParseJsonArguments(benchmark::State& state) {
    // Tool input accumulated from a completion stream.
    const std::string args = R"({"project_id":"p1","canvas_id":"c1","filters":{"status":["open","blocked"],"limit":25}})";
    for (auto _ : state) {
        auto j = Codec::parse_json(args);
        benchmark::DoNotOptimize(j);
    }
    state.SetBytesProcessed(state.iterations() * args.size());
}
BENCHMARK(BM_ParseJsonArguments)->MinTime(1.0);

static void BM_ParseInvalidFrame(benchmark::State& state) {
    const std::string bad = "server listening on stdio, press ctrl-c to exit";
    int64_t rejected = 0;
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const ParseError&) {
            ++rejected;
        }
    }
    state.counters["rejected"] = static_cast<double>(rejected);
}
BENCHMARK(BM_ParseInvalidFrame)->MinTime(1.0);

// ---- Serialize ----

static void BM_SerializeToolCall(benchmark::State& state) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{42}};
    req.method = "tools/call";
    req.params = nlohmann::json{{"name", "search_docs"},
                                {"arguments", {{"query", "deployment checklist"}, {"limit", 10}}}};

    for (auto _ : state) {
        auto s = Codec::serialize(req);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeToolCall)->MinTime(1.0);

static void BM_SerializeCatalogPage(benchmark::State& state) {
    auto msg = Codec::parse(kCatalogPage);

    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kCatalogPage.size());
}
BENCHMARK(BM_SerializeCatalogPage)->MinTime(1.0);
