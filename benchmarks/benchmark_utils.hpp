#pragma once

#include <lfq/mutex_queue.hpp>
#include <lfq/queue.hpp>

#include <benchmark/benchmark.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <thread>

#if defined(__linux__)
#include <pthread.h>
#include <sched.h>
#endif

namespace lfq_bench {

constexpr int kThreadCounts[] = {1, 2, 4, 8, 16};

using Value = std::uint64_t;

struct XorShift64Star {
    std::uint64_t s;

    explicit XorShift64Star(std::uint64_t seed) : s(seed ? seed : 0x9e3779b97f4a7c15ULL) {}

    std::uint64_t next() noexcept {
        std::uint64_t x = s;
        x ^= x >> 12;
        x ^= x << 25;
        x ^= x >> 27;
        s = x;
        return x * 2685821657736338717ULL;
    }
};

inline void pin_thread_index(int thread_index) noexcept {
#if defined(__linux__)
    const unsigned hc = std::thread::hardware_concurrency();
    const unsigned cpu = (hc == 0) ? static_cast<unsigned>(thread_index)
                                   : (static_cast<unsigned>(thread_index) % hc);
    cpu_set_t set;
    CPU_ZERO(&set);
    CPU_SET(static_cast<int>(cpu), &set);
    (void)pthread_setaffinity_np(pthread_self(), sizeof(set), &set);
#else
    (void)thread_index;
#endif
}

inline void add_common_counters(benchmark::State& state, std::uint64_t total_ops) {
    state.counters["threads"] =
        benchmark::Counter(static_cast<double>(state.threads()), benchmark::Counter::kAvgThreads);
    state.counters["total_ops"] =
        benchmark::Counter(static_cast<double>(total_ops), benchmark::Counter::kAvgThreads);
    state.counters["Mops"] =
        benchmark::Counter(static_cast<double>(total_ops) / 1e6, benchmark::Counter::kIsRate);
}

// Both queues share the same interface; only the display name differs.
template <class Q>
struct QueueTraits;

template <>
struct QueueTraits<lfq::Queue<Value>> {
    static constexpr const char* name() { return "Queue"; }
};

template <>
struct QueueTraits<lfq::MutexQueue<Value>> {
    static constexpr const char* name() { return "MutexQueue"; }
};

// One queue shared by every thread of a multi-threaded benchmark run. Thread 0 publishes it
// before the timed loop and unpublishes it afterwards; each thread keeps its own reference, so
// the last thread to leave destroys it.
template <class Q>
class SharedQueue {
public:
    static std::shared_ptr<Q> acquire(const benchmark::State& state, std::size_t prefill) {
        if (state.thread_index() == 0) {
            auto q = std::make_shared<Q>();
            for (std::size_t i = 0; i < prefill; ++i) {
                q->enqueue(static_cast<Value>(i));
            }
            std::atomic_store(&slot_, q);
            return q;
        }

        std::shared_ptr<Q> q;
        while ((q = std::atomic_load(&slot_)) == nullptr) {
            std::this_thread::yield();
        }
        return q;
    }

    // Call after the timed loop: the loop's end is a rendezvous of all threads, so every thread
    // has already taken its reference.
    static void release(const benchmark::State& state) {
        if (state.thread_index() == 0) {
            std::atomic_store(&slot_, std::shared_ptr<Q>());
        }
    }

private:
    inline static std::shared_ptr<Q> slot_;
};

}  // namespace lfq_bench
