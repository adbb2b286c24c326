// jsondb-cpp benchmarks — measures throughput of core store operations.

#include <jsondb-cpp/jsondb.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <filesystem>
#include <string>

using namespace jsondb_cpp;
using json = nlohmann::json;

static auto bench_file(const std::string& name) -> std::string {
    return (std::filesystem::temp_directory_path() / ("jsondb_bench_" + name)).string();
}

static auto bench_schema() -> Schema {
    return Schema{
        {"/records", Shape::array},
        {"/index", Shape::dictionary},
        {"/config", Shape::single},
    };
}

// In-memory store: mutations are never written.
static auto make_store(const std::string& name) -> Store {
    std::filesystem::remove(bench_file(name) + ".json");
    return Store{StoreOptions{.filename = bench_file(name), .save_on_push = false}, bench_schema()};
}

static auto record(std::int64_t i) -> json {
    return json{{"id", i}, {"name", "record " + std::to_string(i)}, {"tags", json::array({"a", "b"})}};
}

// =============================================================================
// Path handling
// =============================================================================

static void bm_parse_path(benchmark::State& state) {
    for (auto _ : state) {
        auto steps = parse_path("/records[12]/tags[-1]/name");
        benchmark::DoNotOptimize(steps);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_parse_path);

static void bm_resolve_path(benchmark::State& state) {
    for (auto _ : state) {
        auto path = resolve_path("/index", Shape::dictionary, at_key("alice"), Access::write);
        benchmark::DoNotOptimize(path);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_resolve_path);

// =============================================================================
// Array entries
// =============================================================================

static void bm_array_push(benchmark::State& state) {
    auto db = make_store("array_push");
    std::int64_t i = 0;
    for (auto _ : state) {
        db.push("/records", record(i++));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_array_push);

static void bm_array_get_by_index(benchmark::State& state) {
    const auto n = state.range(0);
    auto db = make_store("array_get");
    for (std::int64_t i = 0; i < n; ++i) {
        db.push("/records", record(i));
    }
    std::int64_t i = 0;
    for (auto _ : state) {
        auto value = db.get("/records", i++ % n);
        benchmark::DoNotOptimize(value);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_array_get_by_index)->Range(10, 10000);

static void bm_array_merge(benchmark::State& state) {
    auto db = make_store("array_merge");
    db.push("/records", record(0));
    std::int64_t i = 0;
    for (auto _ : state) {
        db.merge("/records", {{"id", i++}}, 0);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_array_merge);

// =============================================================================
// Dictionary entries
// =============================================================================

static void bm_dictionary_push(benchmark::State& state) {
    auto db = make_store("dictionary_push");
    std::int64_t i = 0;
    for (auto _ : state) {
        db.push("/index", i, "key" + std::to_string(i % 1000));
        ++i;
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_dictionary_push);

static void bm_dictionary_exists(benchmark::State& state) {
    auto db = make_store("dictionary_exists");
    for (std::int64_t i = 0; i < 1000; ++i) {
        db.push("/index", i, "key" + std::to_string(i));
    }
    std::int64_t i = 0;
    for (auto _ : state) {
        auto found = db.exists("/index", "key" + std::to_string(i++ % 2000));
        benchmark::DoNotOptimize(found);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_dictionary_exists);

// =============================================================================
// Persistence
// =============================================================================

static void bm_save_document(benchmark::State& state) {
    const auto n = state.range(0);
    auto db = make_store("save");
    for (std::int64_t i = 0; i < n; ++i) {
        db.push("/records", record(i));
    }
    for (auto _ : state) {
        db.save(true);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
    std::filesystem::remove(db.file());
}
BENCHMARK(bm_save_document)->Range(10, 10000);

static void bm_reload_document(benchmark::State& state) {
    const auto n = state.range(0);
    auto db = make_store("reload");
    for (std::int64_t i = 0; i < n; ++i) {
        db.push("/records", record(i));
    }
    db.save();
    for (auto _ : state) {
        db.reload();
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
    std::filesystem::remove(db.file());
}
BENCHMARK(bm_reload_document)->Range(10, 10000);

BENCHMARK_MAIN();
