#pragma once

// Member definitions of lfq::Queue; included from <lfq/queue.hpp> only.

#include <lfq/detail/check.hpp>

#include <utility>

namespace lfq {

template <class T>
Queue<T>::Queue() : owned_ebr_(std::make_unique<EBRManager>()), ebr_(owned_ebr_.get()),
                    head_(nullptr), tail_(nullptr) {
    Node* sentinel = new Node();
    head_.store(sentinel, std::memory_order_relaxed);
    tail_.store(sentinel, std::memory_order_relaxed);
}

template <class T>
Queue<T>::Queue(EBRManager& ebr) : owned_ebr_(), ebr_(&ebr), head_(nullptr), tail_(nullptr) {
    Node* sentinel = new Node();
    head_.store(sentinel, std::memory_order_relaxed);
    tail_.store(sentinel, std::memory_order_relaxed);
}

template <class T>
Queue<T>::~Queue() {
    Node* cur = head_.load(std::memory_order_relaxed);
    while (cur != nullptr) {
        Node* next = cur->next.load(std::memory_order_relaxed);
        delete cur;
        cur = next;
    }
    // Nodes retired by dequeue are freed by the reclamation domain.
}

template <class T>
void Queue<T>::enqueue(const T& value) {
    link(std::make_unique<Node>(value));
}

template <class T>
void Queue<T>::enqueue(T&& value) {
    link(std::make_unique<Node>(std::move(value)));
}

template <class T>
void Queue<T>::link(std::unique_ptr<Node> owned) {
    EpochGuard guard(*ebr_);
    Node* node = owned.release();

    while (true) {
        Node* tail = tail_.load(std::memory_order_seq_cst);
        Node* next = tail->next.load(std::memory_order_seq_cst);

        if (tail != tail_.load(std::memory_order_seq_cst)) {
            continue;
        }

        if (next != nullptr) {
            // Another enqueue linked a node but has not swung the tail yet; finish it for them.
            (void)tail_.compare_exchange_strong(tail, next, std::memory_order_seq_cst);
            continue;
        }

        if (tail->next.compare_exchange_strong(next, node, std::memory_order_seq_cst)) {
            // Best effort: a helper may already have advanced the tail past `tail`.
            (void)tail_.compare_exchange_strong(tail, node, std::memory_order_seq_cst);
            return;
        }
    }
}

template <class T>
std::optional<T> Queue<T>::dequeue() {
    EpochGuard guard(*ebr_);
    // Past the head_ CAS nothing may fail, or the value in the new sentinel would be lost.
    ebr_->prepare_retire();

    while (true) {
        Node* head = head_.load(std::memory_order_seq_cst);
        Node* tail = tail_.load(std::memory_order_seq_cst);
        Node* next = head->next.load(std::memory_order_seq_cst);

        if (head != head_.load(std::memory_order_seq_cst)) {
            continue;
        }

        if (head == tail) {
            if (next == nullptr) {
                return std::nullopt;  // Empty.
            }
            (void)tail_.compare_exchange_strong(tail, next, std::memory_order_seq_cst);
            continue;
        }

        LFQ_CHECK(next != nullptr, "queue tail is ahead of head but head has no successor");

        if (head_.compare_exchange_strong(head, next, std::memory_order_seq_cst)) {
            // `next` is the new sentinel. Only the thread that won the CAS touches its value, and
            // our critical section keeps it alive even if another dequeue retires it meanwhile.
            ebr_->retire(head);
            std::optional<T> out(std::move(next->value));
            next->value.reset();
            return out;
        }
    }
}

template <class T>
bool Queue<T>::dequeue(T& out) {
    std::optional<T> value = dequeue();
    if (!value) {
        return false;
    }
    out = std::move(*value);
    return true;
}

}  // namespace lfq
