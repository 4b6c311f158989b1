#pragma once
// Frontier Router - BackendDirectory
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr snapshot swap.
//   • Read-mostly workload: readers take a snapshot (shared_ptr copy) with ACQUIRE semantics.
//   • Writers perform copy-on-write of the whole map and atomically swap with RELEASE semantics.
//   • Readers never block writers; writers never block readers.
//   • Grace period / reclamation is handled by shared_ptr refcounts (no hazard pointers needed).
// Rings are immutable and shared between snapshots, so a copy-on-write only copies pointers.


#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <unordered_map>
#include <vector>

#include <boost/uuid/uuid_hash.hpp>

#include "frontier/routing/backend.hpp"
#include "frontier/routing/hash_ring.hpp"

namespace frontier::routing {

// -----------------------------------------------------------------------------
// BackendDirectory class
// -----------------------------------------------------------------------------
///
/// Maintains a mapping: FunctionId → HashRing of that function's backends.
/// - Read-mostly workload: optimized with snapshot-swap (RCU-like).
/// - Writes: copy-on-write full map, atomic swap, version increment.
/// - Reads: grab shared_ptr snapshot, consistent, non-blocking.
///
/// Entry semantics:
///   - absent key        → function unknown.
///   - present, empty()  → function known, no backends right now.
///
/// Thread-safety:
///   - Reads are lock-free with respect to writers.
///   - Writes are serialized by an internal mutex (one writer expected).
///   - Readers may see slightly stale data, but never a partially built ring.
//
class BackendDirectory final {
public:
    using RingPtr = std::shared_ptr<const HashRing>;
    using Map     = std::unordered_map<FunctionId, RingPtr, boost::hash<FunctionId>>;

    // --------------------------- RCU Snapshot API ----------------------------
    /// Return a consistent snapshot of the entire directory map.
    /// Readers must copy the shared_ptr, then access freely without locking.
    std::shared_ptr<const Map> snapshot() const noexcept;

    /// Ring currently published for a function; nullptr when the function is unknown.
    [[nodiscard]] RingPtr get(const FunctionId& function_id) const noexcept;

    // --------------------------- Read utilities ------------------------------
    [[nodiscard]] bool contains(const FunctionId& function_id) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::vector<FunctionId> list_functions() const;

    /// Monotonic version counter. Increments on every successful mutation.
    [[nodiscard]] uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

    // --------------------------- Mutations -----------------------------------
    /// Insert or replace the ring of a function. A null ring is stored as an empty ring.
    void put(const FunctionId& function_id, RingPtr ring);
    void put(const FunctionId& function_id, HashRing ring);

    /// Remove a function. Returns true if it was present.
    bool remove(const FunctionId& function_id);

    /// Drop every function not listed in `keep`. Returns the number removed.
    std::size_t retain_only(std::span<const FunctionId> keep);

    /// Clear all functions. Treated as maintenance operation.
    void clear();

    // --------------------------- Observability -------------------------------
    /// Stats counters (atomic, cumulative since start).
    struct Stats {
        uint64_t puts{0}, removes{0};
    };
    [[nodiscard]] Stats stats() const noexcept;

private:
    // Current snapshot of directory map (shared_ptr for RCU semantics).
    std::shared_ptr<const Map> map_{std::make_shared<Map>()};
    std::atomic<uint64_t> version_{0};

    // Serializes writers; readers never take it.
    std::mutex write_mu_;

    // Counters for observability.
    std::atomic<uint64_t> puts_{0}, removes_{0};

    void publish(std::shared_ptr<Map> next) noexcept;
};

} // namespace frontier::routing
