// BackendDirectory - RCU Implementation Notes
// We implement RCU with shared_ptr snapshots:
//   • Readers: atomic_load (ACQUIRE) → non-blocking, consistent view.
//   • Writers: copy current map, mutate, atomic_store (RELEASE).
// The shared_ptr reference count naturally provides a grace period:
// old snapshots remain alive until the last reader drops its ref, after which
// they are reclaimed automatically (no explicit epoch/hazard management).

#include "frontier/routing/backend_directory.hpp"

#include <algorithm>
#include <memory>   // atomic_load/atomic_store for shared_ptr
#include <utility>

namespace frontier::routing {

//------------------------------- Read API -------------------------------------

std::shared_ptr<const BackendDirectory::Map>
BackendDirectory::snapshot() const noexcept {
    // RCU read: acquire ensures any reader observing the pointer also observes
    // the fully constructed map published with RELEASE in writer path.
    return std::atomic_load_explicit(&map_, std::memory_order_acquire);
}

BackendDirectory::RingPtr BackendDirectory::get(const FunctionId& function_id) const noexcept {
    auto snap = snapshot();
    if (!snap) return nullptr;
    auto it = snap->find(function_id);
    if (it == snap->end()) return nullptr;
    return it->second; // shares the immutable ring
}

bool BackendDirectory::contains(const FunctionId& function_id) const noexcept {
    auto snap = snapshot();
    return snap && (snap->find(function_id) != snap->end());
}

std::size_t BackendDirectory::size() const noexcept {
    auto snap = snapshot();
    return snap ? snap->size() : 0;
}

std::vector<FunctionId> BackendDirectory::list_functions() const {
    std::vector<FunctionId> out;
    auto snap = snapshot();
    if (!snap) return out;
    out.reserve(snap->size());
    for (const auto& kv : *snap) out.push_back(kv.first);
    return out;
}

//------------------------------- Mutations ------------------------------------

void BackendDirectory::publish(std::shared_ptr<Map> next) noexcept {
    // RCU update: publish new snapshot. RELEASE pairs with reader ACQUIRE so that
    // all prior writes to *next (the new map) are visible to readers that load it.
    std::shared_ptr<const Map> cnext = std::move(next); // convert Map -> const Map
    std::atomic_store_explicit(&map_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
}

void BackendDirectory::put(const FunctionId& function_id, RingPtr ring) {
    if (!ring) ring = std::make_shared<const HashRing>();

    std::lock_guard<std::mutex> lk(write_mu_);
    auto next = std::make_shared<Map>(*snapshot()); // copy-on-write
    next->insert_or_assign(function_id, std::move(ring));
    publish(std::move(next));
    puts_.fetch_add(1, std::memory_order_relaxed);
}

void BackendDirectory::put(const FunctionId& function_id, HashRing ring) {
    put(function_id, std::make_shared<const HashRing>(std::move(ring)));
}

bool BackendDirectory::remove(const FunctionId& function_id) {
    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    if (!snap || snap->find(function_id) == snap->end()) return false;

    auto next = std::make_shared<Map>(*snap);
    next->erase(function_id);
    publish(std::move(next));
    removes_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

std::size_t BackendDirectory::retain_only(std::span<const FunctionId> keep) {
    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    if (!snap || snap->empty()) return 0;

    auto next = std::make_shared<Map>(*snap);
    const std::size_t removed = std::erase_if(*next, [&](const auto& kv) {
        return std::find(keep.begin(), keep.end(), kv.first) == keep.end();
    });
    if (removed == 0) return 0; // nothing to publish

    publish(std::move(next));
    removes_.fetch_add(removed, std::memory_order_relaxed);
    return removed;
}

void BackendDirectory::clear() {
    std::lock_guard<std::mutex> lk(write_mu_);
    publish(std::make_shared<Map>());
    // Not counting as removes here; treated as maintenance op.
}

BackendDirectory::Stats BackendDirectory::stats() const noexcept {
    return Stats{
        puts_.load(std::memory_order_relaxed),
        removes_.load(std::memory_order_relaxed),
    };
}

} // namespace frontier::routing
