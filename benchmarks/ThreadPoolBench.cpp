#include <benchmark/benchmark.h>
#include "uuidres/rt/ThreadPool.hpp"
#include <future>
#include <vector>

// Round trip of one store-sized job: submit, then wait for its future.
static void BM_ThreadPoolSubmitWait(benchmark::State& state) {
    uuidres::rt::ThreadPool pool(static_cast<unsigned>(state.range(0)));

    for (auto _ : state) {
        auto f = pool.submit([]{ return 1; });
        benchmark::DoNotOptimize(f.get());
    }
    pool.shutdown();

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_ThreadPoolSubmitWait)->Arg(1)->Arg(2)->Arg(4)->Unit(benchmark::kMicrosecond);

static void BM_ThreadPoolSubmitBatch(benchmark::State& state) {
    uuidres::rt::ThreadPool pool(static_cast<unsigned>(state.range(0)));
    std::vector<std::future<int>> futs;
    futs.reserve(100);

    for (auto _ : state) {
        futs.clear();
        for (int i = 0; i < 100; ++i) {
            futs.push_back(pool.submit([i]{ return i; }));
        }
        for (auto& f : futs) benchmark::DoNotOptimize(f.get());
    }
    pool.shutdown();

    state.SetItemsProcessed(state.iterations() * 100);
}

BENCHMARK(BM_ThreadPoolSubmitBatch)->Arg(1)->Arg(2)->Arg(4)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
