// =============================================================================
// pool_store.cpp - Per-pool serialized mutation, snapshot reads
// =============================================================================

#include "dataswap/pool_store.hpp"
#include "dataswap/errors.hpp"
#include "dataswap/logging.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace dataswap {

// =============================================================================
// Constructor / Destructor
// =============================================================================

PoolStore::PoolStore(std::shared_ptr<Backend> backend, std::chrono::milliseconds lock_timeout)
    : backend_(std::move(backend)), lock_timeout_(lock_timeout) {
    if (!backend_) {
        throw Error(ErrorCode::InvalidConfig, "pool store requires a backend");
    }
    for (auto& pool : backend_->fetch_pools()) {
        auto slot = std::make_unique<Slot>();
        std::string id = pool.key.id();
        slot->pool = std::move(pool);
        slots_.emplace(id, std::move(slot));
    }
    spdlog::info("pool store loaded {} pools from {}", slots_.size(), backend_->name());
}

PoolStore::~PoolStore() = default;

// =============================================================================
// Reads
// =============================================================================

PoolStore::Slot* PoolStore::find_slot(const std::string& id) const {
    std::shared_lock lock(slots_mutex_);
    auto it = slots_.find(id);
    return it == slots_.end() ? nullptr : it->second.get();
}

std::optional<Pool> PoolStore::find_pool(const PairKey& key) const {
    Slot* slot = find_slot(key.id());
    if (!slot) return std::nullopt;
    std::shared_lock lock(slot->state_mutex);
    return slot->pool;
}

Pool PoolStore::get_pool(const PairKey& key) const {
    auto pool = find_pool(key);
    if (!pool) {
        throw Error(ErrorCode::PoolNotFound, "no pool for pair " + key.id());
    }
    return *pool;
}

std::vector<Pool> PoolStore::list_pools() const {
    std::shared_lock lock(slots_mutex_);
    std::vector<Pool> result;
    result.reserve(slots_.size());
    for (const auto& [id, slot] : slots_) {
        std::shared_lock state(slot->state_mutex);
        result.push_back(slot->pool);
    }
    std::sort(result.begin(), result.end(),
              [](const Pool& a, const Pool& b) { return a.key < b.key; });
    return result;
}

size_t PoolStore::pool_count() const {
    std::shared_lock lock(slots_mutex_);
    return slots_.size();
}

// =============================================================================
// Creation
// =============================================================================

bool PoolStore::create_pool_if_absent(const PairKey& key) {
    std::string id = key.id();
    if (find_slot(id)) return false;

    std::unique_lock lock(slots_mutex_);
    if (slots_.count(id)) return false;

    auto slot = std::make_unique<Slot>();
    slot->pool.key = key;
    slot->pool.created_at = now_ms();
    slot->pool.updated_at = slot->pool.created_at;

    backend_->store_pool(slot->pool);
    slots_.emplace(id, std::move(slot));
    spdlog::info("created pool {}", id);
    return true;
}

// =============================================================================
// Mutation
// =============================================================================

void PoolStore::check_structure(const Pool& before, const Pool& after) {
    if (after.key != before.key) {
        throw Error(ErrorCode::InvariantViolation,
                    "mutation changed pool key from " + before.key.id() + " to " + after.key.id());
    }
    if (after.reserve_a < 0 || after.reserve_b < 0 || after.total_units < 0) {
        throw Error(ErrorCode::InvariantViolation, "negative quantity in " + describe(after));
    }
    bool reserves_empty = after.reserve_a == 0 && after.reserve_b == 0;
    bool reserves_full = after.reserve_a > 0 && after.reserve_b > 0;
    if (after.total_units == 0 ? !reserves_empty : !reserves_full) {
        throw Error(ErrorCode::InvariantViolation,
                    "units and reserves disagree in " + describe(after));
    }
}

Pool PoolStore::with_pool_lock(const PairKey& key, const Mutation& mutate,
                               const CommitHook& on_commit) {
    return run_locked(key, mutate, nullptr, on_commit, lock_timeout_);
}

Pool PoolStore::with_pool_lock(const PairKey& key, const Mutation& mutate,
                               const CommitHook& on_commit,
                               std::chrono::milliseconds timeout) {
    return run_locked(key, mutate, nullptr, on_commit, timeout);
}

Pool PoolStore::with_pool_lock_persisting(const PairKey& key, const Mutation& mutate,
                                          const Persist& persist,
                                          const CommitHook& on_commit) {
    return run_locked(key, mutate, persist, on_commit, lock_timeout_);
}

Pool PoolStore::run_locked(const PairKey& key, const Mutation& mutate, const Persist& persist,
                           const CommitHook& on_commit, std::chrono::milliseconds timeout) {
    Slot* slot = find_slot(key.id());
    if (!slot) {
        throw Error(ErrorCode::PoolNotFound, "no pool for pair " + key.id());
    }

    std::unique_lock<std::timed_mutex> guard(slot->write_mutex, std::defer_lock);
    if (!guard.try_lock_for(timeout)) {
        lock_timeouts_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("lock timeout after {} ms on pool {}", timeout.count(), key.id());
        throw Error(ErrorCode::LockTimeout,
                    "timed out after " + std::to_string(timeout.count()) +
                    " ms waiting for pool " + key.id());
    }

    // Only writers hold write_mutex, so this copy is the live state
    Pool current;
    {
        std::shared_lock state(slot->state_mutex);
        current = slot->pool;
    }

    std::optional<Pool> proposed;
    try {
        proposed = mutate(current);
        if (proposed) check_structure(current, *proposed);
    } catch (const Error& e) {
        aborted_.fetch_add(1, std::memory_order_relaxed);
        if (e.code() == ErrorCode::InvariantViolation) {
            spdlog::critical("invariant violation: {} (state: {})", e.what(), describe(current));
        }
        throw;
    } catch (const std::exception&) {
        aborted_.fetch_add(1, std::memory_order_relaxed);
        throw;
    }

    if (!proposed) return current;

    Pool next = std::move(*proposed);
    next.version = current.version + 1;
    next.created_at = current.created_at;
    next.updated_at = now_ms();

    // Persist first; readers only ever observe durable state
    try {
        if (persist) {
            persist(next);
        } else {
            backend_->store_pool(next);
        }
    } catch (const std::exception& e) {
        aborted_.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("persisting {} failed, state left at version {}: {}",
                      key.id(), current.version, e.what());
        throw;
    }
    {
        std::unique_lock state(slot->state_mutex);
        slot->pool = next;
    }
    commits_.fetch_add(1, std::memory_order_relaxed);

    if (on_commit) on_commit(next);
    return next;
}

PoolStore::Stats PoolStore::get_stats() const {
    return Stats{
        commits_.load(std::memory_order_relaxed),
        aborted_.load(std::memory_order_relaxed),
        lock_timeouts_.load(std::memory_order_relaxed),
    };
}

} // namespace dataswap
