#include <lfq/ebr.hpp>
#include <lfq/queue.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

namespace {

struct Job {
    std::uint32_t producer;
    std::uint64_t seq;
    std::uint64_t payload;
};

constexpr unsigned kProducers = 4;
constexpr unsigned kConsumers = 4;

}  // namespace

// Usage: producer_consumer [jobs_per_producer]
//
// Producers hand heap-allocated jobs to consumers through one lfq::Queue. Each consumer stops
// when it dequeues an empty pointer; one is enqueued per consumer after every producer is done.
int main(int argc, char** argv) {
    const std::uint64_t jobs_per_producer =
        (argc > 1) ? std::strtoull(argv[1], nullptr, 10) : 250000;
    if (jobs_per_producer == 0) {
        std::cerr << "jobs_per_producer must be > 0\n";
        return 1;
    }

    lfq::EBRManager ebr;
    lfq::Queue<std::unique_ptr<Job>> jobs(ebr);

    std::atomic<std::uint64_t> consumed{0};
    std::atomic<std::uint64_t> checksum{0};
    std::atomic<bool> order_broken{false};

    std::vector<std::thread> consumers;
    for (unsigned c = 0; c < kConsumers; ++c) {
        consumers.emplace_back([&] {
            // Jobs from one producer must reach any single consumer in increasing order.
            std::vector<std::uint64_t> next_seq(kProducers, 0);
            std::uint64_t local_count = 0;
            std::uint64_t local_sum = 0;

            for (;;) {
                std::unique_ptr<Job> job;
                if (!jobs.dequeue(job)) {
                    std::this_thread::yield();
                    continue;
                }
                if (!job) {
                    break;
                }
                if (job->seq < next_seq[job->producer]) {
                    order_broken.store(true, std::memory_order_relaxed);
                }
                next_seq[job->producer] = job->seq + 1;
                local_sum += job->payload;
                ++local_count;
            }

            consumed.fetch_add(local_count, std::memory_order_relaxed);
            checksum.fetch_add(local_sum, std::memory_order_relaxed);
        });
    }

    const auto t0 = std::chrono::steady_clock::now();

    std::vector<std::thread> producers;
    for (unsigned p = 0; p < kProducers; ++p) {
        producers.emplace_back([&, p] {
            for (std::uint64_t i = 0; i < jobs_per_producer; ++i) {
                jobs.enqueue(std::make_unique<Job>(Job{p, i, i * 2654435761u}));
            }
        });
    }
    for (auto& t : producers) {
        t.join();
    }
    for (unsigned c = 0; c < kConsumers; ++c) {
        jobs.enqueue(std::unique_ptr<Job>());
    }
    for (auto& t : consumers) {
        t.join();
    }

    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - t0;

    std::uint64_t expected_sum = 0;
    for (std::uint64_t i = 0; i < jobs_per_producer; ++i) {
        expected_sum += i * 2654435761u;
    }
    expected_sum *= kProducers;

    const std::uint64_t total = jobs_per_producer * kProducers;
    const std::size_t freed = ebr.try_reclaim();

    std::cout << "jobs: " << consumed.load() << " / " << total << "\n"
              << "elapsed: " << elapsed.count() << " s ("
              << static_cast<double>(total) / elapsed.count() / 1e6 << " Mjobs/s)\n"
              << "ebr epoch " << ebr.current_epoch() << ", freed on final pass " << freed
              << ", still pending " << ebr.pending_count() << "\n";

    if (consumed.load() != total || checksum.load() != expected_sum) {
        std::cerr << "ERROR: jobs lost or duplicated\n";
        return 1;
    }
    if (order_broken.load()) {
        std::cerr << "ERROR: per-producer order violated\n";
        return 1;
    }
    return 0;
}
