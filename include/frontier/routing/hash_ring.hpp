#pragma once
/**
 * @file hash_ring.hpp
 * @brief Consistent-hash ring over an immutable snapshot of backends.
 *
 * Each backend contributes `replicas` virtual nodes placed on a 32-bit ring
 * (positions are the leading four bytes of an MD5 digest). A lookup hashes
 * its key the same way and walks clockwise to the first virtual node at or
 * after that position, wrapping around to the lowest one.
 *
 * Properties:
 *  - Immutable after build(): "updating" means building a new ring.
 *  - size() == replicas * number of distinct backends.
 *  - pick() is deterministic and independent of the input order of backends.
 *  - Adding a backend only moves keys onto that backend.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "frontier/routing/backend.hpp"

namespace frontier::routing {

class HashRing final {
public:
    /// One position on the ring owned by a backend.
    struct VirtualNode {
        std::uint32_t hash{0};
        Backend       backend{};

        bool operator==(const VirtualNode&) const = default;
    };

    /// Empty ring (no backends, pick() always misses).
    HashRing() = default;

    /**
     * @brief Build a ring from a backend set.
     * @param backends Backends to insert; duplicates are collapsed.
     * @param replicas Virtual nodes per backend.
     */
    [[nodiscard]] static HashRing build(std::span<const Backend> backends, std::size_t replicas);

    /// Pick the owner of `key` (nullopt when the ring is empty).
    [[nodiscard]] std::optional<Backend> pick(std::span<const std::uint8_t> key) const;
    [[nodiscard]] std::optional<Backend> pick(std::string_view key) const;

    /// Total number of virtual nodes.
    [[nodiscard]] std::size_t size() const noexcept { return nodes_.size(); }
    [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }

    /// Number of distinct backends on the ring.
    [[nodiscard]] std::size_t backend_count() const noexcept { return backend_count_; }
    [[nodiscard]] std::size_t replicas() const noexcept { return replicas_; }

    /// Virtual nodes in ring order.
    [[nodiscard]] std::span<const VirtualNode> nodes() const noexcept { return nodes_; }

    /// Ring position of arbitrary bytes (exposed for tests and diagnostics).
    [[nodiscard]] static std::uint32_t position(std::span<const std::uint8_t> bytes) noexcept;
    [[nodiscard]] static std::uint32_t position(std::string_view text) noexcept;

    /// False when the crypto provider refuses MD5 (e.g. FIPS-only policy).
    [[nodiscard]] static bool digest_available() noexcept;

private:
    std::optional<Backend> owner(std::uint32_t hash) const;

    std::vector<VirtualNode> nodes_;
    std::size_t backend_count_{0};
    std::size_t replicas_{0};
};

} // namespace frontier::routing
