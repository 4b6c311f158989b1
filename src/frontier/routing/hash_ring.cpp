/**
 * @file hash_ring.cpp
 * @brief HashRing construction and lookup.
 */
#include "frontier/routing/hash_ring.hpp"

#include <algorithm>
#include <atomic>
#include <string>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

namespace frontier::routing {

namespace {

/// Leading four digest bytes, big-endian; 0 when MD5 cannot be computed.
std::uint32_t md5_position(const void* data, std::size_t size) noexcept {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data, size, digest, &len, EVP_md5(), nullptr) != 1 || len < 4) {
        static std::atomic<bool> reported{false};
        if (!reported.exchange(true)) {
            spdlog::error("MD5 digest unavailable; every ring position collapses to 0");
        }
        return 0;
    }
    return (static_cast<std::uint32_t>(digest[0]) << 24) |
           (static_cast<std::uint32_t>(digest[1]) << 16) |
           (static_cast<std::uint32_t>(digest[2]) << 8)  |
            static_cast<std::uint32_t>(digest[3]);
}

} // namespace

bool HashRing::digest_available() noexcept {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    return EVP_Digest("", 0, digest, &len, EVP_md5(), nullptr) == 1 && len == 16;
}

std::uint32_t HashRing::position(std::span<const std::uint8_t> bytes) noexcept {
    return md5_position(bytes.data(), bytes.size());
}

std::uint32_t HashRing::position(std::string_view text) noexcept {
    return md5_position(text.data(), text.size());
}

HashRing HashRing::build(std::span<const Backend> backends, std::size_t replicas) {
    BackendList distinct(backends.begin(), backends.end());
    std::sort(distinct.begin(), distinct.end());
    distinct.erase(std::unique(distinct.begin(), distinct.end()), distinct.end());

    HashRing ring;
    ring.replicas_ = replicas;
    ring.backend_count_ = distinct.size();
    ring.nodes_.reserve(distinct.size() * replicas);

    for (const auto& b : distinct) {
        const std::string identity = to_string(b);
        for (std::size_t i = 0; i < replicas; ++i) {
            const std::string vnode = identity + "-" + std::to_string(i);
            ring.nodes_.push_back(VirtualNode{position(vnode), b});
        }
    }

    // Ties on position resolve by backend order, so the result does not
    // depend on the order backends were supplied in.
    std::sort(ring.nodes_.begin(), ring.nodes_.end(),
              [](const VirtualNode& a, const VirtualNode& b) {
                  if (a.hash != b.hash) return a.hash < b.hash;
                  return a.backend < b.backend;
              });
    return ring;
}

std::optional<Backend> HashRing::owner(std::uint32_t h) const {
    if (nodes_.empty()) return std::nullopt;

    auto it = std::lower_bound(nodes_.begin(), nodes_.end(), h,
                               [](const VirtualNode& n, std::uint32_t v) { return n.hash < v; });
    if (it == nodes_.end()) it = nodes_.begin(); // wrap around
    return it->backend;
}

std::optional<Backend> HashRing::pick(std::span<const std::uint8_t> key) const {
    return owner(position(key));
}

std::optional<Backend> HashRing::pick(std::string_view key) const {
    return owner(position(key));
}

} // namespace frontier::routing
