#include "benchmark_utils.hpp"

#include <lfq/ebr.hpp>

namespace {

struct Payload {
    std::uint64_t v[2];
};

static void BM_EBR_EnterExit(benchmark::State& state) {
    static lfq::EBRManager ebr;
    for (auto _ : state) {
        lfq::EpochGuard guard(ebr);
        benchmark::ClobberMemory();
    }
    lfq_bench::add_common_counters(state, static_cast<std::uint64_t>(state.iterations()));
}

// Allocate, retire and eventually free one node per iteration, with every thread sharing a domain.
static void BM_EBR_RetireReclaim(benchmark::State& state) {
    lfq_bench::pin_thread_index(state.thread_index());

    static lfq::EBRManager ebr(static_cast<std::size_t>(lfq::config::DEFAULT_RECLAIM_THRESHOLD));
    for (auto _ : state) {
        lfq::EpochGuard guard(ebr);
        ebr.retire(new Payload{});
    }

    state.counters["pending"] =
        benchmark::Counter(static_cast<double>(ebr.pending_count()), benchmark::Counter::kAvgThreads);
    lfq_bench::add_common_counters(state, static_cast<std::uint64_t>(state.iterations()));
}

}  // namespace

BENCHMARK(BM_EBR_EnterExit)->ThreadRange(1, 8)->UseRealTime();
BENCHMARK(BM_EBR_RetireReclaim)->ThreadRange(1, 8)->UseRealTime();
