#ifndef DATASWAP_POOL_STORE_HPP
#define DATASWAP_POOL_STORE_HPP

#include "dataswap/backend.hpp"
#include "dataswap/types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace dataswap {

// =============================================================================
// PoolStore - keyed pool state with a per-pool mutation lock
// =============================================================================
//
// Snapshot reads never wait on an in-flight mutation. with_pool_lock is the
// only mutation path: it serializes writers per pool, persists the new state
// to the backend, publishes it to readers, then runs the commit hook before
// releasing. Nothing is written or published if the mutation or the
// persistence step throws.

class PoolStore {
public:
    // Builds the next pool state from the current one. Throw to abort;
    // return std::nullopt to release without writing.
    using Mutation = std::function<std::optional<Pool>(const Pool&)>;
    // Writes the next state durably in place of Backend::store_pool, e.g.
    // together with the trade that produced it.
    using Persist = std::function<void(const Pool&)>;
    // Runs after persistence and publication, still under the pool lock.
    using CommitHook = std::function<void(const Pool&)>;

    explicit PoolStore(std::shared_ptr<Backend> backend,
                       std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(5000));
    ~PoolStore();

    // Non-copyable
    PoolStore(const PoolStore&) = delete;
    PoolStore& operator=(const PoolStore&) = delete;

    // Snapshot; throws Error(PoolNotFound)
    Pool get_pool(const PairKey& key) const;
    std::optional<Pool> find_pool(const PairKey& key) const;

    // Idempotent. Returns true if this call created the pool.
    bool create_pool_if_absent(const PairKey& key);

    // Returns the committed (or untouched) pool. Throws PoolNotFound,
    // LockTimeout, InvariantViolation, or whatever the mutation or hook throws.
    Pool with_pool_lock(const PairKey& key, const Mutation& mutate,
                        const CommitHook& on_commit = nullptr);
    Pool with_pool_lock(const PairKey& key, const Mutation& mutate,
                        const CommitHook& on_commit,
                        std::chrono::milliseconds timeout);

    // As with_pool_lock, with persist owning the durable write
    Pool with_pool_lock_persisting(const PairKey& key, const Mutation& mutate,
                                   const Persist& persist,
                                   const CommitHook& on_commit = nullptr);

    std::vector<Pool> list_pools() const;
    size_t pool_count() const;

    std::chrono::milliseconds lock_timeout() const { return lock_timeout_; }
    const Backend& backend() const { return *backend_; }

    struct Stats {
        uint64_t commits;
        uint64_t aborted;
        uint64_t lock_timeouts;
    };
    Stats get_stats() const;

private:
    struct Slot {
        std::timed_mutex write_mutex;      // Held for the whole mutation
        mutable std::shared_mutex state_mutex;  // Guards pool for readers
        Pool pool;
    };

    Pool run_locked(const PairKey& key, const Mutation& mutate, const Persist& persist,
                    const CommitHook& on_commit, std::chrono::milliseconds timeout);

    Slot* find_slot(const std::string& id) const;
    static void check_structure(const Pool& before, const Pool& after);

    std::shared_ptr<Backend> backend_;
    std::chrono::milliseconds lock_timeout_;

    mutable std::shared_mutex slots_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Slot>> slots_;

    std::atomic<uint64_t> commits_{0};
    std::atomic<uint64_t> aborted_{0};
    std::atomic<uint64_t> lock_timeouts_{0};
};

} // namespace dataswap

#endif // DATASWAP_POOL_STORE_HPP
