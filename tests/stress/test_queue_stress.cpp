/**
 * @file test_queue_stress.cpp
 * @brief High-load correctness tests for lfq::Queue
 *
 * Test scenarios:
 * 1. Two producers jointly enqueue 0..999,999 while one consumer collects everything
 * 2. Many producers and consumers, checking per-producer FIFO order
 * 3. Mixed enqueue/dequeue on every thread with a tracked value type (no leaks, no double free)
 * 4. Thread churn (short-lived threads register and release reclamation records)
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <thread>
#include <vector>

#include <lfq/queue.hpp>

namespace {

#if LFQ_ENABLE_SANITIZERS
constexpr std::uint64_t kJointTotal = 200000;
constexpr std::uint32_t kItemsPerProducer = 5000;
constexpr std::size_t kMixedOpsPerThread = 5000;
#else
constexpr std::uint64_t kJointTotal = 1000000;
constexpr std::uint32_t kItemsPerProducer = 50000;
constexpr std::size_t kMixedOpsPerThread = 50000;
#endif

// Barrier for synchronized thread start
class SpinBarrier {
   public:
    explicit SpinBarrier(std::size_t count) : count_(count) {}

    void arrive_and_wait() {
        arrived_.fetch_add(1, std::memory_order_acq_rel);
        while (arrived_.load(std::memory_order_acquire) < count_) {
            std::this_thread::yield();
        }
    }

   private:
    std::size_t count_;
    std::atomic<std::size_t> arrived_{0};
};

// Tracked payload for leak / double-destruction detection
struct TrackedValue {
    inline static std::atomic<std::int64_t> live{0};

    std::uint64_t id;

    explicit TrackedValue(std::uint64_t v) : id(v) { live.fetch_add(1, std::memory_order_relaxed); }
    TrackedValue(TrackedValue&& other) noexcept : id(other.id) {
        live.fetch_add(1, std::memory_order_relaxed);
    }
    TrackedValue(const TrackedValue&) = delete;
    TrackedValue& operator=(const TrackedValue&) = delete;
    TrackedValue& operator=(TrackedValue&&) = default;
    ~TrackedValue() { live.fetch_sub(1, std::memory_order_relaxed); }
};

}  // namespace

// ============================================================================
// Test 1: two producers, one consumer, exactly {0..N-1} comes out
// ============================================================================

TEST(QueueStress, TwoProducersJointRangeNoLossNoDuplicates) {
    lfq::Queue<std::uint64_t> q;
    constexpr std::uint64_t kSplit = kJointTotal / 10;

    std::vector<std::uint64_t> results;
    results.reserve(static_cast<std::size_t>(kJointTotal));

    std::thread consumer([&]() {
        while (results.size() < kJointTotal) {
            if (std::optional<std::uint64_t> v = q.dequeue()) {
                results.push_back(*v);
            } else {
                std::this_thread::yield();
            }
        }
    });

    std::thread producer_a([&]() {
        for (std::uint64_t i = 0; i < kSplit; ++i) {
            q.enqueue(i);
        }
    });
    std::thread producer_b([&]() {
        for (std::uint64_t i = kSplit; i < kJointTotal; ++i) {
            q.enqueue(i);
        }
    });

    producer_a.join();
    producer_b.join();
    consumer.join();

    ASSERT_EQ(results.size(), static_cast<std::size_t>(kJointTotal));
    std::sort(results.begin(), results.end());
    for (std::uint64_t i = 0; i < kJointTotal; ++i) {
        ASSERT_EQ(results[static_cast<std::size_t>(i)], i);
    }
    EXPECT_FALSE(q.dequeue().has_value());
}

// ============================================================================
// Test 2: many producers and consumers, per-producer FIFO
// ============================================================================

TEST(QueueStress, ManyProducersManyConsumersPerProducerFifo) {
    constexpr std::uint32_t kProducers = 4;
    constexpr std::uint32_t kConsumers = 4;
    constexpr std::size_t kTotalItems =
        static_cast<std::size_t>(kProducers) * static_cast<std::size_t>(kItemsPerProducer);

    lfq::Queue<std::uint64_t> q;
    SpinBarrier barrier(kProducers + kConsumers);
    std::atomic<std::size_t> consumed{0};
    std::atomic<bool> fifo_violated{false};

    std::vector<std::vector<std::uint64_t>> per_consumer(kConsumers);
    std::vector<std::thread> threads;
    threads.reserve(kProducers + kConsumers);

    for (std::uint32_t p = 0; p < kProducers; ++p) {
        threads.emplace_back([&, p]() {
            barrier.arrive_and_wait();
            for (std::uint32_t i = 0; i < kItemsPerProducer; ++i) {
                q.enqueue((static_cast<std::uint64_t>(p) << 32) | i);
            }
        });
    }

    for (std::uint32_t c = 0; c < kConsumers; ++c) {
        threads.emplace_back([&, c]() {
            // Each consumer sees every producer's items in increasing sequence order.
            std::vector<std::int64_t> last_seen(kProducers, -1);
            auto& out = per_consumer[c];
            barrier.arrive_and_wait();
            while (consumed.load(std::memory_order_relaxed) < kTotalItems) {
                std::uint64_t v = 0;
                if (!q.dequeue(v)) {
                    std::this_thread::yield();
                    continue;
                }
                const std::uint32_t producer = static_cast<std::uint32_t>(v >> 32);
                const std::int64_t seq = static_cast<std::int64_t>(v & 0xffffffffu);
                if (producer >= kProducers || seq <= last_seen[producer]) {
                    fifo_violated.store(true, std::memory_order_relaxed);
                } else {
                    last_seen[producer] = seq;
                }
                out.push_back(v);
                consumed.fetch_add(1, std::memory_order_relaxed);
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_FALSE(fifo_violated.load()) << "FIFO violated within a producer";

    std::vector<std::uint64_t> all;
    all.reserve(kTotalItems);
    for (const auto& part : per_consumer) {
        all.insert(all.end(), part.begin(), part.end());
    }
    ASSERT_EQ(all.size(), kTotalItems);

    std::vector<std::uint64_t> expected;
    expected.reserve(kTotalItems);
    for (std::uint32_t p = 0; p < kProducers; ++p) {
        for (std::uint32_t i = 0; i < kItemsPerProducer; ++i) {
            expected.push_back((static_cast<std::uint64_t>(p) << 32) | i);
        }
    }
    std::sort(all.begin(), all.end());
    EXPECT_EQ(all, expected);
}

// ============================================================================
// Test 3: mixed operations with a tracked value type
// ============================================================================

TEST(QueueStress, MixedOperationsDestroyEveryValueOnce) {
    constexpr std::size_t kThreads = 8;
    TrackedValue::live.store(0, std::memory_order_relaxed);

    std::atomic<std::size_t> enqueued{0};
    std::atomic<std::size_t> dequeued{0};
    {
        lfq::Queue<TrackedValue> q;
        SpinBarrier barrier(kThreads);
        std::vector<std::thread> threads;
        threads.reserve(kThreads);

        for (std::size_t t = 0; t < kThreads; ++t) {
            threads.emplace_back([&, t]() {
                barrier.arrive_and_wait();
                std::size_t local_enq = 0;
                std::size_t local_deq = 0;
                for (std::size_t i = 0; i < kMixedOpsPerThread; ++i) {
                    if ((i + t) % 3 != 0) {
                        q.enqueue(TrackedValue((static_cast<std::uint64_t>(t) << 32) | i));
                        ++local_enq;
                    } else if (q.dequeue().has_value()) {
                        ++local_deq;
                    }
                }
                enqueued.fetch_add(local_enq, std::memory_order_relaxed);
                dequeued.fetch_add(local_deq, std::memory_order_relaxed);
            });
        }

        for (auto& t : threads) {
            t.join();
        }

        std::size_t drained = 0;
        while (q.dequeue().has_value()) {
            ++drained;
        }
        EXPECT_EQ(dequeued.load() + drained, enqueued.load());
        EXPECT_EQ(TrackedValue::live.load(std::memory_order_relaxed), 0);
    }
    EXPECT_EQ(TrackedValue::live.load(std::memory_order_relaxed), 0);
}

// ============================================================================
// Test 4: thread churn
// ============================================================================

TEST(QueueStress, ThreadChurnKeepsReclamationBounded) {
    lfq::Queue<std::uint64_t> q;
    constexpr int kRounds = 64;
    constexpr int kThreadsPerRound = 4;
    constexpr std::uint64_t kOps = 2000;

    std::uint64_t total_dequeued = 0;
    for (int r = 0; r < kRounds; ++r) {
        std::atomic<std::uint64_t> round_dequeued{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreadsPerRound; ++t) {
            threads.emplace_back([&]() {
                for (std::uint64_t i = 0; i < kOps; ++i) {
                    q.enqueue(i);
                    if (q.dequeue().has_value()) {
                        round_dequeued.fetch_add(1, std::memory_order_relaxed);
                    }
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        total_dequeued += round_dequeued.load();
    }

    while (q.dequeue().has_value()) {
        ++total_dequeued;
    }
    EXPECT_EQ(total_dequeued, static_cast<std::uint64_t>(kRounds) * kThreadsPerRound * kOps);

    // Exited threads left their retired nodes to the domain; a few passes free them.
    lfq::EBRManager& ebr = q.reclaimer();
    for (int i = 0; i < 3; ++i) {
        ebr.try_reclaim();
    }
    if (ebr.pending_count() > 0) {
        std::cout << "[ThreadChurn] pending after reclaim passes: " << ebr.pending_count()
                  << std::endl;
    }
    EXPECT_LE(ebr.pending_count(), 3 * ebr.reclaim_threshold());
}
