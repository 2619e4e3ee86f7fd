/**
 * @file ebr.hpp
 * @brief Epoch-Based Reclamation (EBR) for nodes removed from lock-free structures.
 * @author lfqueue contributors
 * @version 0.1.0
 *
 * Threads bracket every access to an EBR-protected structure with a critical section. A node
 * unlinked from the structure is retired together with the global epoch observed at that moment
 * and is freed only once the global epoch has moved two steps further, which cannot happen while
 * any thread that might still hold a reference remains in its critical section.
 */

#ifndef LFQ_EBR_HPP_
#define LFQ_EBR_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

#include <lfq/config.hpp>

namespace lfq {

namespace detail {
struct EBRDomain;
struct EBRThreadRecord;
}  // namespace detail

/**
 * @class EBRManager
 * @brief Epoch-Based Reclamation (EBR) domain for safe memory reclamation.
 *
 * Each thread that touches the domain is given a private thread record on first use. The record
 * holds the thread's published epoch and its limbo list (retired pointers not yet freed), so
 * @ref enter_critical, @ref exit_critical and @ref retire never synchronize with other threads
 * beyond atomic loads and stores; registration is a lock-free push onto the record list. When a
 * thread exits, its record is released for reuse by later threads and any entries still in its
 * limbo list are handed to the domain as orphans, which the next @ref try_reclaim adopts.
 *
 * A retired pointer with retirement epoch @c e is freed once the global epoch reaches @c e+2.
 * The global epoch only advances from @c E to @c E+1 after every thread inside a critical section
 * has published @c E.
 *
 * Thread-safety: all public methods except the destructor are thread-safe. The destructor frees
 * the calling thread's limbo list and all orphans; it must not race with other threads using the
 * domain. Entries still held by other live threads are freed when those threads exit. A manager
 * may outlive the calling thread's thread_local objects (a static used from @c main).
 *
 * Complexity:
 * - @ref enter_critical / @ref exit_critical - O(1) (first call on a thread scans the registry)
 * - @ref retire - amortized O(1), plus a @ref try_reclaim every reclaim_threshold() calls
 * - @ref try_reclaim - O(R + L) for R registered threads and L limbo entries of the caller
 *
 * Example:
 * @code
 * lfq::EBRManager ebr;
 * {
 *     lfq::EpochGuard g(ebr);
 *     // ... read shared nodes, unlink one ...
 *     ebr.retire(unlinked);
 * }
 * @endcode
 */
class EBRManager {
   public:
    /**
     * @brief Construct a domain with @ref config::DEFAULT_RECLAIM_THRESHOLD.
     */
    EBRManager();

    /**
     * @brief Construct a domain with an explicit reclaim threshold.
     * @param reclaim_threshold Limbo length that triggers @ref try_reclaim from @ref retire
     *        (values below 1 are raised to 1).
     */
    explicit EBRManager(std::size_t reclaim_threshold);

    /**
     * @brief Destroy the domain, reclaiming the caller's and the orphaned retired nodes.
     */
    ~EBRManager();

    EBRManager(const EBRManager&) = delete;
    EBRManager& operator=(const EBRManager&) = delete;
    EBRManager(EBRManager&&) = delete;
    EBRManager& operator=(EBRManager&&) = delete;

    /**
     * @brief Enter a critical section.
     *
     * Publishes the current global epoch for the calling thread. Calls nest; only the outermost
     * call publishes.
     *
     * @throws std::bad_alloc If this is the thread's first use of the domain and registering a
     *         thread record fails.
     */
    void enter_critical();

    /**
     * @brief Exit a critical section. Pairs with enter_critical().
     */
    void exit_critical() noexcept;

    /**
     * @brief Reserve room in the calling thread's limbo list for one more retired pointer.
     *
     * After this call the next @ref retire on the same thread does not allocate, provided its
     * deleter is a plain function (as for @ref retire(T*)). Lock-free structures call it before
     * the CAS that unlinks a node, so that retiring the node afterwards cannot fail.
     *
     * @throws std::bad_alloc If registering the thread or growing the list fails.
     */
    void prepare_retire();

    /**
     * @brief Retire a pointer for later reclamation.
     *
     * The pointer must already be unreachable for threads that enter a critical section after
     * this call.
     *
     * @param ptr Pointer to retire (nullptr is ignored).
     * @param deleter Function invoked with @p ptr once it is safe to free.
     *
     * @throws std::bad_alloc If the limbo list grows and allocation fails; @p ptr is then not
     *         retired. Cannot happen right after @ref prepare_retire.
     */
    void retire(void* ptr, std::function<void(void*)> deleter);

    /**
     * @brief Retire a node using default delete.
     *
     * @tparam T Type of the pointer
     * @param ptr Pointer to retire
     *
     * @throws std::bad_alloc As for retire(void*, std::function<void(void*)>).
     */
    template <typename T>
    void retire(T* ptr) {
        retire(static_cast<void*>(ptr), &delete_as<T>);
    }

    /**
     * @brief Try to advance the global epoch and free the caller's reclaimable nodes.
     *
     * Adopts pending orphans into the caller's limbo list first.
     *
     * @return Number of nodes freed.
     */
    std::size_t try_reclaim();

    /** @brief Current global epoch. */
    std::uint64_t current_epoch() const noexcept;

    /** @brief Whether any retired node, in any thread's limbo list or orphaned, is not yet freed. */
    bool has_pending() const noexcept;

    /** @brief Number of retired nodes not yet freed, across all threads. */
    std::size_t pending_count() const noexcept;

    /** @brief Limbo length that triggers @ref try_reclaim from @ref retire. */
    std::size_t reclaim_threshold() const noexcept;

   private:
    template <typename T>
    static void delete_as(void* p) {
        delete static_cast<T*>(p);
    }

    detail::EBRThreadRecord* local_record();

    // Shared with the thread-local bindings of every thread that used this domain, so a thread
    // exiting after the manager is destroyed still finds its record.
    std::shared_ptr<detail::EBRDomain> domain_;
};

/**
 * @class EpochGuard
 * @brief RAII guard for EBR critical sections.
 *
 * Calls enter_critical() on construction and exit_critical() on destruction.
 *
 * Usage:
 * @code
 * EBRManager& ebr = ...;
 * {
 *     EpochGuard guard(ebr);
 *     // Access shared data structure safely
 * } // exit_critical() called automatically
 * @endcode
 */
class EpochGuard {
   public:
    /**
     * @brief Construct an EpochGuard and enter critical section
     *
     * @param ebr Reference to the EBR manager
     * @throws std::bad_alloc See EBRManager::enter_critical().
     */
    explicit EpochGuard(EBRManager& ebr) : ebr_(ebr) { ebr_.enter_critical(); }

    /**
     * @brief Destroy the EpochGuard and exit critical section
     */
    ~EpochGuard() noexcept { ebr_.exit_critical(); }

    EpochGuard(const EpochGuard&) = delete;
    EpochGuard& operator=(const EpochGuard&) = delete;
    EpochGuard(EpochGuard&&) = delete;
    EpochGuard& operator=(EpochGuard&&) = delete;

   private:
    EBRManager& ebr_;
};

}  // namespace lfq

#endif  // LFQ_EBR_HPP_
