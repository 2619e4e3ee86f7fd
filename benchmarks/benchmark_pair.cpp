#include "benchmark_utils.hpp"

namespace {

// Every thread alternates enqueue and dequeue on one shared queue.
template <class Q>
static void BM_Pair(benchmark::State& state) {
    lfq_bench::pin_thread_index(state.thread_index());

    const int threads = static_cast<int>(state.threads());

    // Warm start so early dequeues do not all hit an empty queue.
    std::shared_ptr<Q> q =
        lfq_bench::SharedQueue<Q>::acquire(state, static_cast<std::size_t>(threads) * 100u);

    std::uint64_t seq = static_cast<std::uint64_t>(state.thread_index()) << 40;
    for (auto _ : state) {
        q->enqueue(seq++);

        lfq_bench::Value out = 0;
        while (!q->dequeue(out)) {
            std::this_thread::yield();
        }
        benchmark::DoNotOptimize(out);
    }

    lfq_bench::SharedQueue<Q>::release(state);

    const std::uint64_t total_ops =
        static_cast<std::uint64_t>(state.iterations()) * static_cast<std::uint64_t>(threads) * 2u;
    lfq_bench::add_common_counters(state, total_ops);
}

// Random enqueue/dequeue mix; dequeues on an empty queue count as operations.
template <class Q, int EnqueuePct>
static void BM_Mixed(benchmark::State& state) {
    lfq_bench::pin_thread_index(state.thread_index());

    static_assert(EnqueuePct >= 0 && EnqueuePct <= 100);

    const int threads = static_cast<int>(state.threads());
    std::shared_ptr<Q> q =
        lfq_bench::SharedQueue<Q>::acquire(state, static_cast<std::size_t>(threads) * 100u);

    lfq_bench::XorShift64Star rng(0x9e3779b97f4a7c15ULL ^
                                  (static_cast<std::uint64_t>(state.thread_index()) + 1u));

    std::uint64_t seq = 0;
    for (auto _ : state) {
        if (static_cast<int>(rng.next() % 100u) < EnqueuePct) {
            q->enqueue(seq++);
        } else {
            lfq_bench::Value out = 0;
            benchmark::DoNotOptimize(q->dequeue(out));
            benchmark::DoNotOptimize(out);
        }
    }

    lfq_bench::SharedQueue<Q>::release(state);

    const std::uint64_t total_ops =
        static_cast<std::uint64_t>(state.iterations()) * static_cast<std::uint64_t>(threads);
    lfq_bench::add_common_counters(state, total_ops);
}

}  // namespace

static void apply_threads(benchmark::internal::Benchmark* b) {
    for (int t : lfq_bench::kThreadCounts) {
        b->Threads(t);
    }
    b->UseRealTime();
}

using lfq_bench::Value;

BENCHMARK(BM_Pair<lfq::Queue<Value>>)->Name("BM_Queue_Pair")->Apply(apply_threads);
BENCHMARK(BM_Pair<lfq::MutexQueue<Value>>)->Name("BM_MutexQueue_Pair")->Apply(apply_threads);

BENCHMARK(BM_Mixed<lfq::Queue<Value>, 50>)->Name("BM_Queue_Mixed50")->Apply(apply_threads);
BENCHMARK(BM_Mixed<lfq::MutexQueue<Value>, 50>)
    ->Name("BM_MutexQueue_Mixed50")
    ->Apply(apply_threads);
BENCHMARK(BM_Mixed<lfq::Queue<Value>, 70>)->Name("BM_Queue_Mixed70")->Apply(apply_threads);
BENCHMARK(BM_Mixed<lfq::MutexQueue<Value>, 70>)
    ->Name("BM_MutexQueue_Mixed70")
    ->Apply(apply_threads);
