/**
 * @file mutex_queue.hpp
 * @brief Lock-based FIFO used as the comparison point in benchmarks.
 * @author lfqueue contributors
 * @version 0.1.0
 */

#ifndef LFQ_MUTEX_QUEUE_HPP_
#define LFQ_MUTEX_QUEUE_HPP_

#include <deque>
#include <mutex>
#include <utility>

namespace lfq {

/**
 * @class MutexQueue
 * @brief @c std::deque guarded by one mutex, with the @c enqueue / @c dequeue(T&) calls of
 * @ref Queue so a benchmark can be instantiated for either.
 */
template <class T>
class MutexQueue {
   public:
    void enqueue(T value) {
        std::lock_guard<std::mutex> lock(mu_);
        items_.push_back(std::move(value));
    }

    bool dequeue(T& out) {
        std::lock_guard<std::mutex> lock(mu_);
        if (items_.empty()) {
            return false;
        }
        out = std::move(items_.front());
        items_.pop_front();
        return true;
    }

   private:
    std::mutex mu_;
    std::deque<T> items_;
};

}  // namespace lfq

#endif  // LFQ_MUTEX_QUEUE_HPP_
