#include <gtest/gtest.h>

#include <lfq/mutex_queue.hpp>

#include <cstdint>
#include <thread>
#include <vector>

TEST(MutexQueue, DrainsInInsertionOrder) {
    lfq::MutexQueue<std::uint64_t> q;
    std::uint64_t out = 0;
    EXPECT_FALSE(q.dequeue(out));

    for (std::uint64_t i = 0; i < 64; ++i) {
        q.enqueue(i);
    }
    for (std::uint64_t i = 0; i < 64; ++i) {
        ASSERT_TRUE(q.dequeue(out));
        EXPECT_EQ(out, i);
    }
    EXPECT_FALSE(q.dequeue(out));
}

// Same shape as the pair benchmark: every thread pushes one value and pops one.
TEST(MutexQueue, PairWorkloadBalances) {
    lfq::MutexQueue<std::uint64_t> q;
    constexpr int kThreads = 4;
    constexpr int kRounds = 5000;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&q, t]() {
            for (int i = 0; i < kRounds; ++i) {
                q.enqueue(static_cast<std::uint64_t>(t) * kRounds + i);
                std::uint64_t v = 0;
                while (!q.dequeue(v)) {
                    std::this_thread::yield();
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    std::uint64_t out = 0;
    EXPECT_FALSE(q.dequeue(out));
}
