#include <benchmark/benchmark.h>
#include "reqkit/params/Fold.hpp"
#include "reqkit/params/Params.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace p = reqkit::params;

namespace {

reqkit::Param makeTree(int headers, int depth) {
    std::vector<reqkit::Param> level;
    for (int i = 0; i < headers; ++i) {
        level.push_back(p::header("X-Bench-" + std::to_string(i), "value"));
    }
    reqkit::Param tree = p::combined(level);
    for (int d = 0; d < depth; ++d) {
        tree = p::combined({p::accept("application/json"), tree, p::query("d", std::to_string(d))});
    }
    return p::combined({p::url("https://api.example.com/v1/items"), p::method(reqkit::Method::Post),
                        tree, p::timeout(std::chrono::milliseconds(500)), p::body("{\"k\":1}")});
}

} // namespace

static void BM_FoldFlat(benchmark::State& state) {
    auto tree = makeTree(static_cast<int>(state.range(0)), 0);
    for (auto _ : state) {
        auto r = reqkit::fold(tree);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_FoldFlat)->Arg(1)->Arg(8)->Arg(64)->Unit(benchmark::kNanosecond);

static void BM_FoldNested(benchmark::State& state) {
    auto tree = makeTree(4, static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto r = reqkit::fold(tree);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_FoldNested)->Arg(1)->Arg(8)->Arg(32)->Unit(benchmark::kMicrosecond);

static void BM_FoldDynamicHeader(benchmark::State& state) {
    int counter = 0;
    auto tree = p::combined({
        p::url("http://localhost/poll"),
        p::header("X-Seq", [&counter]{ return std::to_string(++counter); }),
    });
    for (auto _ : state) {
        auto r = reqkit::fold(tree);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_FoldDynamicHeader)->Unit(benchmark::kNanosecond);

BENCHMARK_MAIN();
