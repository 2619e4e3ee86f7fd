#include <lfq/ebr.hpp>
#include <lfq/log.hpp>
#include <lfq/mutex_queue.hpp>
#include <lfq/queue.hpp>

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

int main() {
    std::cout << "lfqueue examples - simple usage (single-thread)\n\n";

    // Reclamation events are logged at debug level; LFQ_LOG_LEVEL=debug also enables them.
    lfq::set_log_level(spdlog::level::info);

    // -----------------------------------------------------------------------------
    // 1) Queue: unbounded MPMC queue storing values
    // -----------------------------------------------------------------------------
    //
    // enqueue() never fails for lack of room; dequeue() returns std::nullopt when empty.
    lfq::Queue<std::uint64_t> q;

    std::cout << "[Queue] enqueue 1..5\n";
    for (std::uint64_t v = 1; v <= 5; ++v) {
        q.enqueue(v);
    }

    std::cout << "[Queue] dequeue until empty (optional):\n";
    while (std::optional<std::uint64_t> v = q.dequeue()) {
        std::cout << "  got " << *v << "\n";
    }
    std::cout << "[Queue] pending retired nodes: " << q.reclaimer().pending_count() << "\n\n";

    // -----------------------------------------------------------------------------
    // 2) Move-only payloads
    // -----------------------------------------------------------------------------
    //
    // Ownership moves into the queue on enqueue and out of it on dequeue.
    {
        lfq::Queue<std::unique_ptr<std::string>> owned;
        owned.enqueue(std::make_unique<std::string>("alpha"));
        owned.enqueue(std::make_unique<std::string>("beta"));

        std::cout << "[Queue<unique_ptr>] dequeue until empty (bool):\n";
        std::unique_ptr<std::string> s;
        while (owned.dequeue(s)) {
            std::cout << "  got " << *s << "\n";
        }
        std::cout << "\n";
    }

    // -----------------------------------------------------------------------------
    // 3) Several queues sharing one reclamation domain
    // -----------------------------------------------------------------------------
    {
        lfq::EBRManager ebr(/*reclaim_threshold=*/16);
        lfq::Queue<int> a(ebr);
        lfq::Queue<int> b(ebr);

        for (int i = 0; i < 100; ++i) {
            a.enqueue(i);
            b.enqueue(-i);
        }
        int out = 0;
        int drained = 0;
        while (a.dequeue(out)) {
            ++drained;
        }
        while (b.dequeue(out)) {
            ++drained;
        }
        std::cout << "[shared EBR] drained " << drained << " values, epoch " << ebr.current_epoch()
                  << ", pending " << ebr.pending_count() << "\n\n";
    }

    // -----------------------------------------------------------------------------
    // 4) MutexQueue: lock-based baseline with the same interface
    // -----------------------------------------------------------------------------
    {
        lfq::MutexQueue<std::uint64_t> muq;
        std::cout << "[MutexQueue] enqueue 7,8,9\n";
        muq.enqueue(7);
        muq.enqueue(8);
        muq.enqueue(9);

        std::cout << "[MutexQueue] dequeue until empty (bool):\n";
        std::uint64_t out = 0;
        while (muq.dequeue(out)) {
            std::cout << "  got " << out << "\n";
        }
        std::cout << "\n";
    }

    std::cout << "Done.\n";
    return 0;
}
