#include <benchmark/benchmark.h>
#include "reqkit/dispatch/ResponseDispatcher.hpp"
#include "reqkit/rt/ThreadPool.hpp"
#include <atomic>
#include <string>
#include <vector>

namespace {

reqkit::Result<reqkit::Response> makeResponse(int items) {
    std::string body = "[";
    for (int i = 0; i < items; ++i) {
        if (i) body += ',';
        body += std::to_string(i * 3);
    }
    body += ']';

    reqkit::Response r;
    r.status = 200;
    r.body = std::move(body);
    return r;
}

} // namespace

static void BM_DispatchAllConsumers(benchmark::State& state) {
    auto res = makeResponse(static_cast<int>(state.range(0)));
    std::size_t sink = 0;

    reqkit::CallbackSet<std::vector<int>> cbs;
    cbs.onData       = [&sink](const std::string& b){ sink += b.size(); };
    cbs.onString     = [&sink](const std::string& s){ sink += s.size(); };
    cbs.onJson       = [&sink](const rapidjson::Document& d){ sink += d.Size(); };
    cbs.onObject     = [&sink](const std::vector<int>& v){ sink += v.size(); };
    cbs.onStatusCode = [&sink](int s){ sink += static_cast<std::size_t>(s); };

    for (auto _ : state) {
        reqkit::ResponseDispatcher<std::vector<int>>::dispatch(res, cbs);
    }
    benchmark::DoNotOptimize(sink);
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(res->body.size()));
}

BENCHMARK(BM_DispatchAllConsumers)->Arg(16)->Arg(1024)->Unit(benchmark::kMicrosecond);

static void BM_DispatchBytesOnly(benchmark::State& state) {
    auto res = makeResponse(1024);
    std::size_t sink = 0;
    reqkit::CallbackSet<std::string> cbs;
    cbs.onData = [&sink](const std::string& b){ sink += b.size(); };

    for (auto _ : state) {
        reqkit::ResponseDispatcher<std::string>::dispatch(res, cbs);
    }
    benchmark::DoNotOptimize(sink);
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_DispatchBytesOnly)->Unit(benchmark::kNanosecond);

static void BM_DispatchOnPool(benchmark::State& state) {
    reqkit::rt::ThreadPool pool(static_cast<unsigned>(state.range(0)));
    auto res = makeResponse(64);
    std::atomic<int> statuses{0};

    reqkit::CallbackSet<std::string> cbs;
    cbs.onString     = [](const std::string&){};
    cbs.onStatusCode = [&statuses](int){ statuses.fetch_add(1, std::memory_order_relaxed); };

    for (auto _ : state) {
        for (int i = 0; i < 100; ++i) {
            pool.post([&res, &cbs]{ reqkit::ResponseDispatcher<std::string>::dispatch(res, cbs); });
        }
        pool.drain();
    }
    pool.shutdown();

    state.SetItemsProcessed(state.iterations() * 100);
}

BENCHMARK(BM_DispatchOnPool)->Arg(1)->Arg(2)->Arg(4)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
