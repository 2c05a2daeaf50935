#include <benchmark/benchmark.h>
#include "uuidres/resolver/UuidResolverHandle.hpp"
#include "uuidres/util/Config.hpp"
#include "uuidres/util/Logger.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace {

// Registry on a throwaway directory, removed when the benchmark ends.
struct BenchRegistry {
    std::filesystem::path dir;
    std::optional<uuidres::resolver::UuidResolverHandle> resolver;

    static std::filesystem::path freshDir() {
        auto d = std::filesystem::temp_directory_path() /
                 ("uuidres-bench-" + uuidres::toString(uuidres::newUuidV4()));
        std::filesystem::create_directories(d);
        return d;
    }

    static uuidres::util::Config config(const std::filesystem::path& d) {
        uuidres::util::Config cfg;
        cfg.dataDir = d.string();
        return cfg;
    }

    BenchRegistry()
        : dir(freshDir())
        , resolver(uuidres::resolver::UuidResolverHandle::open(config(dir))) {
        uuidres::util::logger().setLevel(uuidres::util::LogLevel::Warn);
    }

    const uuidres::resolver::UuidResolverHandle& handle() const { return *resolver; }

    ~BenchRegistry() {
        resolver.reset();  // joins the actor before the files go
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
};

} // namespace

static void BM_ResolverGetHit(benchmark::State& state) {
    BenchRegistry reg;
    if (!reg.handle().create("movies")) {
        state.SkipWithError("create failed");
        return;
    }

    for (auto _ : state) {
        auto r = reg.handle().get("movies");
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_ResolverGetHit)->Unit(benchmark::kMicrosecond);

static void BM_ResolverGetMiss(benchmark::State& state) {
    BenchRegistry reg;

    for (auto _ : state) {
        auto r = reg.handle().get("missing");
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_ResolverGetMiss)->Unit(benchmark::kMicrosecond);

static void BM_ResolverCreateDelete(benchmark::State& state) {
    BenchRegistry reg;

    for (auto _ : state) {
        auto c = reg.handle().create("churn");
        auto d = reg.handle().remove("churn");
        benchmark::DoNotOptimize(c);
        benchmark::DoNotOptimize(d);
    }
    state.SetItemsProcessed(state.iterations() * 2);
}

BENCHMARK(BM_ResolverCreateDelete)->Unit(benchmark::kMicrosecond);

static void BM_ResolverList(benchmark::State& state) {
    BenchRegistry reg;
    for (int i = 0; i < state.range(0); ++i) {
        if (!reg.handle().insert("idx" + std::to_string(i), uuidres::newUuidV4())) {
            state.SkipWithError("insert failed");
            return;
        }
    }

    for (auto _ : state) {
        auto r = reg.handle().list();
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_ResolverList)->Arg(10)->Arg(1000)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
