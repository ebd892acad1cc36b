// jqesque-cpp benchmarks — measures parse and apply throughput.

#include <jqesque-cpp/jqesque.hpp>

#include <benchmark/benchmark.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

using namespace jqesque_cpp;
using json = nlohmann::json;

static auto deep_path(std::size_t depth) -> std::string {
    auto path = std::string{"root"};
    for (std::size_t i = 0; i < depth; ++i) {
        path += (i % 2 == 0) ? ".level" + std::to_string(i) : "[0]";
    }
    return path;
}

// =============================================================================
// Parsing
// =============================================================================

static void bm_parse_simple(benchmark::State& state) {
    for (auto _ : state) {
        auto a = parse("foo.bar[0].baz=hello");
        benchmark::DoNotOptimize(a);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_parse_simple);

static void bm_parse_quoted_keys(benchmark::State& state) {
    for (auto _ : state) {
        auto a = parse(R"(>"a.b"."c\"d"."e f"[3]="text")");
        benchmark::DoNotOptimize(a);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_parse_quoted_keys);

static void bm_parse_json_value(benchmark::State& state) {
    const auto input = std::string{R"(~settings={"theme":{"color":"blue","sizes":[1,2,3,4,5]}})"};
    for (auto _ : state) {
        auto a = parse(input);
        benchmark::DoNotOptimize(a);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * input.size()));
}
BENCHMARK(bm_parse_json_value);

static void bm_parse_path_depth(benchmark::State& state) {
    const auto path = deep_path(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto p = parse_path(path);
        benchmark::DoNotOptimize(p);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_parse_path_depth)->Range(4, 256);

// =============================================================================
// Application
// =============================================================================

static void bm_as_json(benchmark::State& state) {
    const auto a = parse("foo.bar[0].baz=hello");
    for (auto _ : state) {
        auto doc = a.as_json();
        benchmark::DoNotOptimize(doc);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_as_json);

static void bm_replace_in_place(benchmark::State& state) {
    auto doc = json{};
    parse(deep_path(static_cast<std::size_t>(state.range(0))) + "=0").apply(doc);
    const auto a = parse("=" + deep_path(static_cast<std::size_t>(state.range(0))) + "=1");
    for (auto _ : state) {
        a.apply(doc);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_replace_in_place)->Range(4, 256);

static void bm_append(benchmark::State& state) {
    auto doc = json{};
    const auto a = parse("+items[-]=1");
    for (auto _ : state) {
        a.apply(doc);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_append);

static void bm_merge(benchmark::State& state) {
    auto doc = json{};
    for (std::int64_t i = 0; i < state.range(0); ++i) {
        parse("config.k" + std::to_string(i) + "=" + std::to_string(i)).apply(doc);
    }
    const auto a = parse(R"(~config={"k0":"x","extra":{"nested":true}})");
    for (auto _ : state) {
        a.apply(doc);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_merge)->Range(8, 4096);

static void bm_apply_copy(benchmark::State& state) {
    auto doc = json{};
    for (std::int64_t i = 0; i < state.range(0); ++i) {
        parse("+list[-]=" + std::to_string(i)).apply(doc);
    }
    const auto a = parse("=list[0]=-1");
    for (auto _ : state) {
        auto copy = a.apply_copy(doc);
        benchmark::DoNotOptimize(copy);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_apply_copy)->Range(8, 4096);
