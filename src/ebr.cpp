#include <lfq/ebr.hpp>
#include <lfq/log.hpp>

#include <algorithm>
#include <atomic>
#include <new>
#include <utility>
#include <vector>

namespace lfq {

namespace detail {

struct RetiredNode {
    void* ptr;
    std::function<void(void*)> deleter;
    std::uint64_t epoch;
};

// One per (thread, domain) pair. `state`, `in_use` and `pending` are read by other threads; the
// remaining fields belong to the thread that currently holds the record.
struct EBRThreadRecord {
    std::atomic<std::uint64_t> state{0};  // (epoch << 1) | active
    std::atomic<bool> in_use{false};
    std::atomic<std::size_t> pending{0};

    std::size_t depth = 0;
    std::size_t scan_at = 0;
    std::vector<RetiredNode> limbo;

    EBRThreadRecord* next = nullptr;  // Immutable once published.
};

struct OrphanBatch {
    std::vector<RetiredNode> entries;
    OrphanBatch* next = nullptr;
};

struct EBRDomain {
    EBRDomain(std::uint64_t domain_id, std::size_t threshold)
        : id(domain_id), reclaim_threshold(threshold) {}
    ~EBRDomain();

    EBRDomain(const EBRDomain&) = delete;
    EBRDomain& operator=(const EBRDomain&) = delete;

    const std::uint64_t id;
    const std::size_t reclaim_threshold;

    alignas(config::kCacheLineSize) std::atomic<std::uint64_t> global_epoch{0};
    alignas(config::kCacheLineSize) std::atomic<EBRThreadRecord*> records{nullptr};
    std::atomic<OrphanBatch*> orphans{nullptr};
    std::atomic<std::size_t> orphan_count{0};
    std::atomic<bool> closed{false};
};

}  // namespace detail

namespace {

using detail::EBRDomain;
using detail::EBRThreadRecord;
using detail::OrphanBatch;
using detail::RetiredNode;

constexpr std::uint64_t kActiveBit = 1;

std::atomic<std::uint64_t> g_next_domain_id{1};

constexpr std::uint64_t pack_state(std::uint64_t epoch, bool active) noexcept {
    return (epoch << 1) | (active ? kActiveBit : 0);
}

constexpr std::uint64_t state_epoch(std::uint64_t state) noexcept { return state >> 1; }

constexpr bool state_active(std::uint64_t state) noexcept { return (state & kActiveBit) != 0; }

// Deleters must not call back into the domain that owns `nodes`.
std::size_t free_nodes(std::vector<RetiredNode>& nodes) noexcept {
    std::size_t freed = 0;
    for (auto& node : nodes) {
        if (node.ptr != nullptr && node.deleter) {
            node.deleter(node.ptr);
            ++freed;
        }
    }
    nodes.clear();
    return freed;
}

std::size_t free_orphans(OrphanBatch* batch) noexcept {
    std::size_t freed = 0;
    while (batch != nullptr) {
        OrphanBatch* next = batch->next;
        freed += free_nodes(batch->entries);
        delete batch;
        batch = next;
    }
    return freed;
}

EBRThreadRecord* acquire_record(EBRDomain& domain) {
    // Reuse a record released by an exited thread before growing the list.
    for (EBRThreadRecord* rec = domain.records.load(std::memory_order_acquire); rec != nullptr;
         rec = rec->next) {
        bool expected = false;
        if (!rec->in_use.load(std::memory_order_relaxed) &&
            rec->in_use.compare_exchange_strong(expected, true, std::memory_order_acquire,
                                                std::memory_order_relaxed)) {
            rec->depth = 0;
            rec->scan_at = rec->limbo.size() + domain.reclaim_threshold;
            return rec;
        }
    }

    auto* rec = new EBRThreadRecord();
    rec->in_use.store(true, std::memory_order_relaxed);
    rec->scan_at = domain.reclaim_threshold;

    EBRThreadRecord* head = domain.records.load(std::memory_order_relaxed);
    do {
        rec->next = head;
    } while (!domain.records.compare_exchange_weak(head, rec, std::memory_order_release,
                                                   std::memory_order_relaxed));

    logger()->debug("ebr[{}]: registered new thread record", domain.id);
    return rec;
}

void release_record(EBRDomain& domain, EBRThreadRecord* rec) noexcept {
    rec->depth = 0;
    const std::uint64_t state = rec->state.load(std::memory_order_relaxed);
    rec->state.store(pack_state(state_epoch(state), false), std::memory_order_seq_cst);

    if (!rec->limbo.empty()) {
        if (domain.closed.load(std::memory_order_acquire)) {
            (void)free_nodes(rec->limbo);
            rec->pending.store(0, std::memory_order_relaxed);
        } else if (auto* batch = new (std::nothrow) OrphanBatch()) {
            const std::size_t count = rec->limbo.size();
            batch->entries.swap(rec->limbo);
            domain.orphan_count.fetch_add(count, std::memory_order_relaxed);
            rec->pending.store(0, std::memory_order_relaxed);

            OrphanBatch* head = domain.orphans.load(std::memory_order_relaxed);
            do {
                batch->next = head;
            } while (!domain.orphans.compare_exchange_weak(head, batch, std::memory_order_release,
                                                           std::memory_order_relaxed));
        }
        // Otherwise the entries stay with the record and pass to the next thread that acquires it.
    }

    rec->in_use.store(false, std::memory_order_release);
}

bool try_advance_epoch(EBRDomain& domain) noexcept {
    std::uint64_t epoch = domain.global_epoch.load(std::memory_order_seq_cst);

    for (const EBRThreadRecord* rec = domain.records.load(std::memory_order_acquire);
         rec != nullptr; rec = rec->next) {
        const std::uint64_t state = rec->state.load(std::memory_order_seq_cst);
        if (state_active(state) && state_epoch(state) != epoch) {
            return false;
        }
    }

    return domain.global_epoch.compare_exchange_strong(epoch, epoch + 1,
                                                       std::memory_order_seq_cst);
}

// Moves entries left behind by exited threads into `rec`'s limbo list. Never throws: if the limbo
// list cannot grow, the batches go back to the domain for a later pass.
void adopt_orphans(EBRDomain& domain, EBRThreadRecord& rec) noexcept {
    OrphanBatch* batches = domain.orphans.exchange(nullptr, std::memory_order_acquire);
    if (batches == nullptr) {
        return;
    }

    std::size_t incoming = 0;
    OrphanBatch* last = batches;
    for (OrphanBatch* b = batches; b != nullptr; b = b->next) {
        incoming += b->entries.size();
        last = b;
    }

    try {
        rec.limbo.reserve(rec.limbo.size() + incoming);
    } catch (const std::bad_alloc&) {
        OrphanBatch* head = domain.orphans.load(std::memory_order_relaxed);
        do {
            last->next = head;
        } while (!domain.orphans.compare_exchange_weak(head, batches, std::memory_order_release,
                                                       std::memory_order_relaxed));
        logger()->warn("ebr[{}]: could not adopt {} orphaned nodes, deferring", domain.id,
                       incoming);
        return;
    }

    while (batches != nullptr) {
        OrphanBatch* next = batches->next;
        for (auto& node : batches->entries) {
            rec.limbo.push_back(std::move(node));
        }
        delete batches;
        batches = next;
    }
    domain.orphan_count.fetch_sub(incoming, std::memory_order_relaxed);
    rec.pending.store(rec.limbo.size(), std::memory_order_relaxed);
    logger()->debug("ebr[{}]: adopted {} orphaned nodes", domain.id, incoming);
}

// Per-thread map from domain id to the record this thread holds in that domain.
class ThreadBindings {
   public:
    ThreadBindings() = default;
    ~ThreadBindings() {
        for (auto& binding : bindings_) {
            release_record(*binding.domain, binding.record);
        }
    }

    ThreadBindings(const ThreadBindings&) = delete;
    ThreadBindings& operator=(const ThreadBindings&) = delete;

    EBRThreadRecord* find(std::uint64_t domain_id) const noexcept {
        for (const auto& binding : bindings_) {
            if (binding.domain_id == domain_id) {
                return binding.record;
            }
        }
        return nullptr;
    }

    EBRThreadRecord* bind(const std::shared_ptr<EBRDomain>& domain) {
        prune_closed();
        bindings_.reserve(bindings_.size() + 1);
        EBRThreadRecord* rec = acquire_record(*domain);
        bindings_.push_back(Binding{domain->id, domain, rec});
        return rec;
    }

   private:
    struct Binding {
        std::uint64_t domain_id;
        std::shared_ptr<EBRDomain> domain;
        EBRThreadRecord* record;
    };

    // Drop bindings whose manager has been destroyed so their domains can be freed.
    void prune_closed() noexcept {
        auto it = std::remove_if(bindings_.begin(), bindings_.end(), [](Binding& binding) {
            if (!binding.domain->closed.load(std::memory_order_acquire)) {
                return false;
            }
            release_record(*binding.domain, binding.record);
            return true;
        });
        bindings_.erase(it, bindings_.end());
    }

    std::vector<Binding> bindings_;
};

// The bindings live behind plain thread_local pointers so that a manager destroyed after this
// thread's thread_local objects (a static on the main thread) never touches a destroyed object.
thread_local ThreadBindings* tls_bindings = nullptr;
thread_local int tls_release_rounds = 0;

// Releases the thread's records when the thread's thread_local objects are destroyed.
struct BindingsReleaser {
    ~BindingsReleaser() {
        delete tls_bindings;
        tls_bindings = nullptr;
        ++tls_release_rounds;
    }
    void arm() noexcept {}
};

thread_local BindingsReleaser tls_releaser;
// Armed only by domain use from another thread_local destructor, after tls_releaser has run.
thread_local BindingsReleaser tls_late_releaser;

// Bindings of the calling thread, or nullptr if it has none.
ThreadBindings* current_bindings() noexcept { return tls_bindings; }

ThreadBindings& bindings_for_registration() {
    if (tls_bindings == nullptr) {
        tls_bindings = new ThreadBindings();
        if (tls_release_rounds == 0) {
            tls_releaser.arm();
        } else if (tls_release_rounds == 1) {
            tls_late_releaser.arm();
        }
        // Past the second round nothing releases the new bindings; their records stay claimed.
    }
    return *tls_bindings;
}

}  // namespace

detail::EBRDomain::~EBRDomain() {
    EBRThreadRecord* rec = records.load(std::memory_order_acquire);
    while (rec != nullptr) {
        EBRThreadRecord* next = rec->next;
        (void)free_nodes(rec->limbo);
        delete rec;
        rec = next;
    }
    (void)free_orphans(orphans.exchange(nullptr, std::memory_order_acquire));
}

EBRManager::EBRManager() : EBRManager(config::DEFAULT_RECLAIM_THRESHOLD) {}

EBRManager::EBRManager(std::size_t reclaim_threshold)
    : domain_(std::make_shared<detail::EBRDomain>(
          g_next_domain_id.fetch_add(1, std::memory_order_relaxed),
          std::max<std::size_t>(reclaim_threshold, 1))) {
    // Creates the logger here, so later logging from retire() never allocates it.
    logger()->debug("ebr[{}]: created, reclaim threshold {}", domain_->id,
                    domain_->reclaim_threshold);
}

EBRManager::~EBRManager() {
    EBRDomain& domain = *domain_;
    domain.closed.store(true, std::memory_order_seq_cst);

    std::size_t freed = 0;
    ThreadBindings* bindings = current_bindings();
    if (EBRThreadRecord* own = bindings != nullptr ? bindings->find(domain.id) : nullptr) {
        freed += free_nodes(own->limbo);
        own->pending.store(0, std::memory_order_relaxed);
    }

    // Released records may still hold entries if handing them over as orphans failed.
    for (EBRThreadRecord* rec = domain.records.load(std::memory_order_acquire); rec != nullptr;
         rec = rec->next) {
        if (!rec->in_use.load(std::memory_order_acquire)) {
            freed += free_nodes(rec->limbo);
            rec->pending.store(0, std::memory_order_relaxed);
        }
    }

    freed += free_orphans(domain.orphans.exchange(nullptr, std::memory_order_acquire));
    domain.orphan_count.store(0, std::memory_order_relaxed);

    logger()->debug("ebr[{}]: closed, freed {} retired nodes", domain.id, freed);
}

EBRThreadRecord* EBRManager::local_record() {
    ThreadBindings& bindings = bindings_for_registration();
    if (EBRThreadRecord* rec = bindings.find(domain_->id)) {
        return rec;
    }
    return bindings.bind(domain_);
}

void EBRManager::enter_critical() {
    EBRThreadRecord* rec = local_record();
    if (rec->depth++ == 0) {
        const std::uint64_t epoch = domain_->global_epoch.load(std::memory_order_seq_cst);
        rec->state.store(pack_state(epoch, true), std::memory_order_seq_cst);
    }
}

void EBRManager::exit_critical() noexcept {
    ThreadBindings* bindings = current_bindings();
    EBRThreadRecord* rec = bindings != nullptr ? bindings->find(domain_->id) : nullptr;
    if (rec == nullptr || rec->depth == 0) {
        return;
    }
    if (--rec->depth == 0) {
        const std::uint64_t state = rec->state.load(std::memory_order_relaxed);
        rec->state.store(pack_state(state_epoch(state), false), std::memory_order_seq_cst);
    }
}

void EBRManager::prepare_retire() {
    EBRThreadRecord* rec = local_record();
    auto& limbo = rec->limbo;
    if (limbo.size() == limbo.capacity()) {
        limbo.reserve(std::max(limbo.size() * 2, domain_->reclaim_threshold));
    }
}

void EBRManager::retire(void* ptr, std::function<void(void*)> deleter) {
    if (ptr == nullptr) {
        return;
    }

    EBRThreadRecord* rec = local_record();
    const std::uint64_t epoch = domain_->global_epoch.load(std::memory_order_seq_cst);
    rec->limbo.push_back(RetiredNode{ptr, std::move(deleter), epoch});
    rec->pending.store(rec->limbo.size(), std::memory_order_relaxed);

    if (rec->limbo.size() >= rec->scan_at) {
        (void)try_reclaim();
    }
}

std::size_t EBRManager::try_reclaim() {
    EBRDomain& domain = *domain_;
    EBRThreadRecord* rec = local_record();

    if (domain.orphans.load(std::memory_order_relaxed) != nullptr) {
        adopt_orphans(domain, *rec);
    }

    if (try_advance_epoch(domain)) {
        logger()->trace("ebr[{}]: epoch advanced to {}", domain.id,
                        domain.global_epoch.load(std::memory_order_relaxed));
    }

    const std::uint64_t epoch = domain.global_epoch.load(std::memory_order_seq_cst);
    std::size_t reclaimed = 0;

    // A node retired in epoch e is safe to delete once the global epoch reaches e + 2.
    if (epoch >= 2) {
        auto& limbo = rec->limbo;
        const auto keep_end =
            std::partition(limbo.begin(), limbo.end(),
                           [epoch](const RetiredNode& node) { return node.epoch + 2 > epoch; });
        for (auto it = keep_end; it != limbo.end(); ++it) {
            if (it->ptr != nullptr && it->deleter) {
                it->deleter(it->ptr);
                ++reclaimed;
            }
        }
        limbo.erase(keep_end, limbo.end());
    }

    rec->pending.store(rec->limbo.size(), std::memory_order_relaxed);
    rec->scan_at = rec->limbo.size() + domain.reclaim_threshold;

    if (reclaimed != 0) {
        logger()->trace("ebr[{}]: reclaimed {} nodes at epoch {}, {} still pending", domain.id,
                        reclaimed, epoch, rec->limbo.size());
    }
    return reclaimed;
}

std::uint64_t EBRManager::current_epoch() const noexcept {
    return domain_->global_epoch.load(std::memory_order_acquire);
}

bool EBRManager::has_pending() const noexcept { return pending_count() != 0; }

std::size_t EBRManager::pending_count() const noexcept {
    const EBRDomain& domain = *domain_;
    std::size_t count = domain.orphan_count.load(std::memory_order_relaxed);
    for (const EBRThreadRecord* rec = domain.records.load(std::memory_order_acquire);
         rec != nullptr; rec = rec->next) {
        count += rec->pending.load(std::memory_order_relaxed);
    }
    return count;
}

std::size_t EBRManager::reclaim_threshold() const noexcept { return domain_->reclaim_threshold; }

}  // namespace lfq
