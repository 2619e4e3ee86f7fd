/**
 * @file queue.hpp
 * @brief Michael-Scott (M&S) lock-free unbounded MPMC queue with epoch-based reclamation.
 * @author lfqueue contributors
 * @version 0.1.0
 */

#ifndef LFQ_QUEUE_HPP_
#define LFQ_QUEUE_HPP_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

#include <lfq/config.hpp>
#include <lfq/ebr.hpp>

namespace lfq {

/**
 * @class Queue
 * @brief Unbounded lock-free FIFO queue (Michael-Scott algorithm).
 *
 * The queue is a singly-linked list whose first node is a sentinel: @c head_ points at the
 * sentinel, the first element lives in its successor, and @c tail_ points at the last node or at
 * most one node behind it. Any thread that observes a lagging tail advances it before retrying.
 *
 * Dequeue advances @c head_ to the first element's node, which becomes the new sentinel after its
 * value is moved out by the winning thread. The previous sentinel is retired to an
 * @ref EBRManager and freed once no thread can still be reading it. Because a retired node cannot
 * be freed, and hence its address cannot be reused, while any thread that loaded it is still in
 * its critical section, a CAS on @c head_, @c tail_ or a @c next field never succeeds against a
 * recycled address (no ABA).
 *
 * Every atomic access uses @c std::memory_order_seq_cst.
 *
 * @tparam T Value type. Must be move-constructible; @ref enqueue(const T&) additionally requires
 *         copy-construction.
 *
 * Thread-safety: @ref enqueue and @ref dequeue are lock-free and safe for any number of
 * concurrent producers and consumers. Construction and destruction must not race with other
 * operations on the same queue.
 *
 * Complexity: O(1) expected per operation (retries under contention).
 *
 * Example:
 * @code
 * lfq::Queue<int> q;
 * q.enqueue(1);
 * if (std::optional<int> v = q.dequeue()) {
 *     // *v == 1
 * }
 * @endcode
 */
template <class T>
class Queue {
   private:
    struct Node {
        std::optional<T> value;
        std::atomic<Node*> next;

        Node() : value(), next(nullptr) {}
        template <class U>
        explicit Node(U&& v) : value(std::forward<U>(v)), next(nullptr) {}
    };

   public:
    /** @brief Value type stored in the queue. */
    using value_type = T;

    /** @brief Construct an empty queue that owns a private reclamation domain. */
    Queue();

    /**
     * @brief Construct an empty queue that retires removed nodes into @p ebr.
     * @param ebr Reclamation domain; must outlive the queue.
     */
    explicit Queue(EBRManager& ebr);

    /** @brief Destroy the queue and every value still in it (must not race with other threads). */
    ~Queue();

    Queue(const Queue&) = delete;
    Queue& operator=(const Queue&) = delete;
    Queue(Queue&&) = delete;
    Queue& operator=(Queue&&) = delete;

    /**
     * @brief Append a copy of @p value at the tail.
     * @throws std::bad_alloc If allocating the node fails; the queue is left unchanged.
     */
    void enqueue(const T& value);

    /**
     * @brief Append @p value at the tail by moving it.
     * @throws std::bad_alloc If allocating the node fails; the queue is left unchanged.
     */
    void enqueue(T&& value);

    /**
     * @brief Remove and return the value at the head.
     * @return The dequeued value, or @c std::nullopt if the queue was observed empty.
     */
    std::optional<T> dequeue();

    /**
     * @brief Remove the value at the head into @p out.
     * @param[out] out Receives the dequeued value.
     * @return true if an element was dequeued; false if the queue was empty.
     */
    bool dequeue(T& out);

    /** @brief Reclamation domain removed nodes are retired to. */
    EBRManager& reclaimer() noexcept { return *ebr_; }

    /**
     * @brief Return the internal node size in bytes.
     * @return Size of one node allocation.
     */
    static constexpr std::size_t node_size_bytes() noexcept { return sizeof(Node); }

   private:
    void link(std::unique_ptr<Node> node);

    std::unique_ptr<EBRManager> owned_ebr_;
    EBRManager* ebr_;

    alignas(config::kCacheLineSize) std::atomic<Node*> head_;
    alignas(config::kCacheLineSize) std::atomic<Node*> tail_;
};

extern template class Queue<std::uint64_t>;
extern template class Queue<std::uint32_t>;

}  // namespace lfq

#include <lfq/detail/queue_impl.hpp>

#endif  // LFQ_QUEUE_HPP_
