/// @file bench_record.cpp
/// @brief Performance benchmarks for the recdata containers.
///
/// Measured operations:
///   - Keyed lookup (below and above the hash index threshold)
///   - Insertion and in-place update
///   - Debug and display rendering
///   - Recursive search

#include <recdata/recdata.hpp>

#include <benchmark/benchmark.h>

#include <regex>
#include <string>
#include <vector>

using namespace recdata;

// ═══════════════════════════════════════════════════════════════════════════════
// Test data generators
// ═══════════════════════════════════════════════════════════════════════════════

/// Flat record with @p n integer fields k0..k{n-1}.
static Record make_flat(int n) {
    Record r;
    for (int i = 0; i < n; ++i) r.set("k" + std::to_string(i), i);
    return r;
}

/// Decoded-file shaped tree: a header plus @p chunks chunk records, each
/// with a payload and a nested flags record.
static Record make_tree(int chunks) {
    Sequence list;
    for (int i = 0; i < chunks; ++i) {
        list.push_back(Record{
            {"id", "chk" + std::to_string(i)},
            {"size", i * 16},
            {"data", Bytes(64, static_cast<uint8_t>(i))},
            {"flags", Record{{"compressed", i % 2 == 0}, {"encrypted", false}}},
            {"_offset", i * 80},
        });
    }
    return Record{
        {"magic", "RIFF"},
        {"version", 2},
        {"chunks", std::move(list)},
    };
}

// ═══════════════════════════════════════════════════════════════════════════════
// Lookup benchmarks
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_LookupHit(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    auto r = make_flat(n);
    std::vector<std::string> keys;
    for (int i = 0; i < n; ++i) keys.push_back("k" + std::to_string(i));

    size_t i = 0;
    for (auto _ : state) {
        const Value* v = r.find(keys[i++ % keys.size()]);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_LookupHit)->Arg(4)->Arg(15)->Arg(16)->Arg(256)->Arg(4096);

static void BM_LookupMiss(benchmark::State& state) {
    auto r = make_flat(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        bool found = r.contains("absent");
        benchmark::DoNotOptimize(found);
    }
}
BENCHMARK(BM_LookupMiss)->Arg(8)->Arg(256);

// ═══════════════════════════════════════════════════════════════════════════════
// Mutation benchmarks
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_BuildRecord(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    for (auto _ : state) {
        auto r = make_flat(n);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(BM_BuildRecord)->Arg(8)->Arg(64)->Arg(1024);

static void BM_UpdateInPlace(benchmark::State& state) {
    auto r = make_flat(64);
    int64_t i = 0;
    for (auto _ : state) {
        r.set("k32", i++);
    }
}
BENCHMARK(BM_UpdateInPlace);

static void BM_EraseAndReinsert(benchmark::State& state) {
    auto r = make_flat(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        r.erase("k0");
        r.set("k0", 0);
    }
}
BENCHMARK(BM_EraseAndReinsert)->Arg(8)->Arg(256);

// ═══════════════════════════════════════════════════════════════════════════════
// Rendering benchmarks
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Repr(benchmark::State& state) {
    auto r = make_tree(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto s = r.repr();
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_Repr)->Arg(10)->Arg(100);

static void BM_Display(benchmark::State& state) {
    auto r = make_tree(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto s = r.str();
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_Display)->Arg(10)->Arg(100);

// ═══════════════════════════════════════════════════════════════════════════════
// Search benchmarks
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_SearchAll(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    auto r = make_tree(n);
    const std::regex pattern = compile_pattern("^id$");
    for (auto _ : state) {
        auto all = r.search_all(pattern);
        benchmark::DoNotOptimize(all);
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(BM_SearchAll)->Arg(10)->Arg(100);

static void BM_SearchCompileEachCall(benchmark::State& state) {
    auto r = make_tree(10);
    for (auto _ : state) {
        auto hit = r.search("^encrypted$");
        benchmark::DoNotOptimize(hit);
    }
}
BENCHMARK(BM_SearchCompileEachCall);
