#include <benchmark/benchmark.h>
#include "foundry/stream_encoder.hpp"
#include <string>
#include <vector>

using namespace foundry;

static std::vector<StreamEvent> make_turn(int text_chunks) {
    std::vector<StreamEvent> events;
    for (int i = 0; i < text_chunks; ++i) {
        events.push_back(TextDelta{"Here is part " + std::to_string(i) + " of the answer. "});
    }
    events.push_back(ToolInvoked{"toolu_01", "list_canvases", {{"project_id", "p1"}}});
    events.push_back(ToolResult{"toolu_01", "list_canvases",
                                nlohmann::json::array({{{"id", "c1"}, {"name", "Backend"}},
                                                       {{"id", "c2"}, {"name", "Frontend"}}}),
                                false});
    events.push_back(TextDelta{"Done."});
    events.push_back(Done{"local:p1", "claude-opus-4-6", std::string("a1b2c3d4e5f6a7b8")});
    return events;
}

static void BM_EncodeTextDelta(benchmark::State& state) {
    StreamEvent ev = TextDelta{"The canvas \"Backend\" has 4 components.\nTwo are unconnected."};
    for (auto _ : state) {
        auto frame = StreamEncoder::encode(ev);
        benchmark::DoNotOptimize(frame);
    }
}
BENCHMARK(BM_EncodeTextDelta);

static void BM_EncodeTurn(benchmark::State& state) {
    auto events = make_turn(static_cast<int>(state.range(0)));
    std::size_t bytes = 0;
    for (auto _ : state) {
        std::string out;
        for (const auto& ev : events) out += StreamEncoder::encode(ev);
        bytes += out.size();
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(static_cast<int64_t>(bytes));
}
BENCHMARK(BM_EncodeTurn)->Arg(10)->Arg(100)->Arg(1000);

static void BM_DecodeChunked(benchmark::State& state) {
    std::string wire;
    for (const auto& ev : make_turn(100)) wire += StreamEncoder::encode(ev);
    const auto chunk = static_cast<std::size_t>(state.range(0));

    for (auto _ : state) {
        StreamDecoder decoder;
        std::size_t n = 0;
        for (std::size_t off = 0; off < wire.size(); off += chunk) {
            n += decoder.feed(std::string_view(wire).substr(off, chunk)).size();
        }
        benchmark::DoNotOptimize(n);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(wire.size()));
}
BENCHMARK(BM_DecodeChunked)->Arg(16)->Arg(512)->Arg(8192);
