#include "handoff/bounded_queue.hpp"
#include "handoff/pipeline.hpp"
#include <benchmark/benchmark.h>
#include <ranges>
#include <string>
#include <vector>

constexpr auto ten_thousand = 10'000;

static void BM_queue_10k_put_get_single_thread(benchmark::State& s)
{
    for (auto _ : s) {
        handoff::bounded_queue<int> q{ten_thousand};
        for (auto n = 0; n != ten_thousand; ++n) {
            q.put(n);
        }
        for (auto n = 0; n != ten_thousand; ++n) {
            benchmark::DoNotOptimize(q.get());
        }
    }
}

static void BM_pipeline_10k_ints(benchmark::State& s)
{
    const auto capacity = s.range(0);
    for (auto _ : s) {
        auto got = handoff::run(std::views::iota(0, ten_thousand), capacity);
        benchmark::DoNotOptimize(got.data());
    }
    s.SetItemsProcessed(s.iterations() * ten_thousand);
}

static void BM_pipeline_10k_strings(benchmark::State& s)
{
    std::vector<std::string> src;
    src.reserve(ten_thousand);
    for (auto n = 0; n != ten_thousand; ++n) {
        src.push_back("a string long enough to dodge sso #" +
                      std::to_string(n));
    }
    const auto capacity = s.range(0);
    for (auto _ : s) {
        auto got = handoff::run(src, capacity);
        benchmark::DoNotOptimize(got.data());
    }
    s.SetItemsProcessed(s.iterations() * ten_thousand);
}

BENCHMARK(BM_queue_10k_put_get_single_thread);
BENCHMARK(BM_pipeline_10k_ints)->Arg(1)->Arg(64)->Arg(ten_thousand);
BENCHMARK(BM_pipeline_10k_strings)->Arg(1)->Arg(64)->Arg(ten_thousand);

BENCHMARK_MAIN();
