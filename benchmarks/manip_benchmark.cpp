// jsonmanip-cpp benchmarks — measures throughput of core operations.

#include <jsonmanip-cpp/jsonmanip.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <utility>

using namespace jsonmanip_cpp;

static auto make_items(std::int64_t n) -> Value {
    auto items = Array{};
    items.reserve(static_cast<std::size_t>(n));
    for (std::int64_t i = 0; i < n; ++i) {
        items.push_back(Object{{"id", i}, {"price", i % 100}, {"name", "item" + std::to_string(i)}});
    }
    return Object{{"items", std::move(items)}};
}

// =============================================================================
// Queries
// =============================================================================

static void bm_compile_query(benchmark::State& state) {
    for (auto _ : state) {
        auto query = compile_query("$.items[@.price >= 10 && @.price < 20 && @.name].id");
        benchmark::DoNotOptimize(query);
    }
}
BENCHMARK(bm_compile_query);

static void bm_select_filter(benchmark::State& state) {
    auto root = Array{};
    root.push_back(make_items(state.range(0)));
    const auto query = compile_query("$.items[@.price < 10].name");
    for (auto _ : state) {
        auto nodes = query.evaluate(Node{&root, std::int64_t{0}});
        benchmark::DoNotOptimize(nodes);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_select_filter)->Range(64, 16384);

static void bm_select_slice(benchmark::State& state) {
    auto root = Array{};
    root.push_back(make_items(state.range(0)));
    const auto query = compile_query("$.items[::2].id");
    for (auto _ : state) {
        auto nodes = query.evaluate(Node{&root, std::int64_t{0}});
        benchmark::DoNotOptimize(nodes);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_select_slice)->Range(64, 16384);

static void bm_load_query_value(benchmark::State& state) {
    for (auto _ : state) {
        auto value = load_query_value("-1.5e10");
        benchmark::DoNotOptimize(value);
    }
}
BENCHMARK(bm_load_query_value);

// =============================================================================
// Patching
// =============================================================================

static void bm_apply_patch(benchmark::State& state) {
    const auto doc = make_items(state.range(0));
    const auto patch = Value{Array{
        Object{{"op", "del"}, {"path", "$.items[@.price >= 50]"}},
        Object{{"op", "set"}, {"path", "$.items[@.price < 10].cheap"}, {"value", true}},
        Object{{"op", "reverse"}, {"path", "$.items"}},
    }};
    for (auto _ : state) {
        auto result = apply_patch(doc, patch);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_apply_patch)->Range(64, 4096);

static void bm_delete_every_other(benchmark::State& state) {
    auto source = Array{};
    for (std::int64_t i = 0; i < state.range(0); ++i) source.push_back(i);
    const auto doc = Value{std::move(source)};
    const auto patch = Value{Object{{"op", "del"}, {"path", "$[::2]"}}};
    for (auto _ : state) {
        auto result = apply_patch(doc, patch);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_delete_every_other)->Range(64, 16384);

// =============================================================================
// Diff
// =============================================================================

static void bm_make_patch(benchmark::State& state) {
    const auto n = state.range(0);
    auto old_items = Array{};
    auto new_items = Array{};
    for (std::int64_t i = 0; i < n; ++i) {
        old_items.push_back(i);
        if (i % 7 != 0) new_items.push_back(i);
        if (i % 11 == 0) new_items.push_back(-i);
    }
    const auto old_value = Value{std::move(old_items)};
    const auto new_value = Value{std::move(new_items)};
    for (auto _ : state) {
        auto patch = make_patch(old_value, new_value);
        benchmark::DoNotOptimize(patch);
    }
}
BENCHMARK(bm_make_patch)->Range(16, 1024);

BENCHMARK_MAIN();
