// docstore-cpp benchmarks: measures throughput of core operations.

#include <docstore-cpp/docstore.hpp>

#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using namespace docstore_cpp;

static auto make_record(std::int64_t i) -> Value {
    return Value{Object{
        {"_id", "r" + std::to_string(i)},
        {"member", i % 10},
        {"data", Object{{"size", i}, {"name", "record-" + std::to_string(i)}}},
        {"list", Array{Object{{"a", i % 7}, {"b", i % 3}}, Object{{"a", i % 5}, {"b", 1}}}},
    }};
}

static auto make_store(std::int64_t n) -> InMemoryStore {
    auto db = InMemoryStore{};
    auto records = std::vector<Value>{};
    records.reserve(static_cast<std::size_t>(n));
    for (std::int64_t i = 0; i < n; ++i) records.push_back(make_record(i));
    db.create_list("bench", std::move(records));
    return db;
}

// =============================================================================
// Filters
// =============================================================================

static void bm_compile_filter(benchmark::State& state) {
    const auto filter = Filter{
        {"data.size.gte", 10},
        {"list.ANYINDEX.a", 3},
        {"list.ANYINDEX.b.neq", 0},
        {"member", Array{1, 2, 3}},
    };
    for (auto _ : state) {
        benchmark::DoNotOptimize(compile(filter));
    }
}
BENCHMARK(bm_compile_filter);

static void bm_match_simple(benchmark::State& state) {
    const auto record = make_record(42);
    const auto predicate = compile({{"data.size.gte", 10}, {"member", 2}});
    for (auto _ : state) {
        benchmark::DoNotOptimize(matches(record, predicate));
    }
}
BENCHMARK(bm_match_simple);

static void bm_match_anyindex(benchmark::State& state) {
    const auto record = make_record(42);
    const auto predicate = compile({{"list.ANYINDEX.a", 2}, {"list.ANYINDEX.b", 1}});
    for (auto _ : state) {
        benchmark::DoNotOptimize(matches(record, predicate));
    }
}
BENCHMARK(bm_match_anyindex);

static void bm_get_list(benchmark::State& state) {
    auto db = make_store(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(db.get_list("bench", {{"member", 3}}));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_get_list)->Range(100, 10000);

static void bm_count(benchmark::State& state) {
    auto db = make_store(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(db.count("bench", {{"data.size.lt", 50}}));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_count)->Range(100, 10000);

// =============================================================================
// Patches and updates
// =============================================================================

static void bm_merge_patch_dict(benchmark::State& state) {
    const auto target = make_record(7);
    const auto patch = parse_json(R"({"data": {"size": null, "extra": {"x": 1}}, "member": 4})");
    for (auto _ : state) {
        auto copy = target;
        apply_merge_patch(copy, patch);
        benchmark::DoNotOptimize(copy);
    }
}
BENCHMARK(bm_merge_patch_dict);

static void bm_merge_patch_array_edit(benchmark::State& state) {
    const auto n = state.range(0);
    auto items = Array{};
    for (std::int64_t i = 0; i < n; ++i) items.push_back(Object{{"id", i}, {"v", "x"}});
    const auto target = Value{Object{{"items", std::move(items)}}};
    const auto patch = parse_json(R"({"items": {"${id: 3}": {"v": "y"}, "$[0]": null, "$+": {"id": -1}}})");
    for (auto _ : state) {
        auto copy = target;
        apply_merge_patch(copy, patch);
        benchmark::DoNotOptimize(copy);
    }
}
BENCHMARK(bm_merge_patch_array_edit)->Range(8, 1024);

static void bm_set_one(benchmark::State& state) {
    auto db = make_store(1000);
    std::int64_t i = 0;
    for (auto _ : state) {
        db.set_one("bench", {{"_id", "r500"}}, {{"data.counter", i++}});
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_set_one);
