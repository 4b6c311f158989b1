/**
 * @file test_hash_ring.cpp
 * @brief Tests for HashRing construction and lookup.
 *
 * Validates:
 *  - size() == replicas * distinct backends; duplicates collapse
 *  - MD5-derived positions and "<ip>-<instance>-<i>" virtual node keys
 *  - Deterministic, order-independent picks; clockwise ownership with wrap-around
 *  - Spread over several backends; adding a backend only moves keys onto it
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include <span>
#include <string>
#include <vector>

#include "frontier/config/constants.hpp"
#include "frontier/routing/hash_ring.hpp"
#include "test_support.hpp"

using frontier::routing::Backend;
using frontier::routing::BackendList;
using frontier::routing::HashRing;
using frontier::testing::backend;

namespace {

const Backend A = backend("10.0.0.1", "00000000-0000-0000-0000-00000000000a");
const Backend B = backend("10.0.0.2", "00000000-0000-0000-0000-00000000000b");
const Backend C = backend("10.0.0.3", "00000000-0000-0000-0000-00000000000c");
const Backend D = backend("10.0.0.4", "00000000-0000-0000-0000-00000000000d");

std::string client(int i) { return "192.168." + std::to_string(i / 256) + "." + std::to_string(i % 256); }

} // namespace

/**
 * @test Empty_Ring_Misses
 * @brief No backends: size 0 and pick() returns nothing.
 */
TEST(HashRing, Empty_Ring_Misses) {
  const auto ring = HashRing::build({}, 20);
  EXPECT_TRUE(ring.empty());
  EXPECT_EQ(ring.size(), 0u);
  EXPECT_EQ(ring.backend_count(), 0u);
  EXPECT_FALSE(ring.pick("10.1.1.1").has_value());

  HashRing defaulted;
  EXPECT_FALSE(defaulted.pick("10.1.1.1").has_value());
}

/**
 * @test Size_Is_Replicas_Times_Backends
 */
TEST(HashRing, Size_Is_Replicas_Times_Backends) {
  const BackendList set{A, B, C};
  for (std::size_t r : {1u, 5u, 20u, 64u}) {
    const auto ring = HashRing::build(set, r);
    EXPECT_EQ(ring.size(), r * set.size()) << "replicas=" << r;
    EXPECT_EQ(ring.backend_count(), set.size());
    EXPECT_EQ(ring.replicas(), r);
  }
}

/**
 * @test Duplicates_Collapse
 * @brief The same backend listed twice contributes one set of virtual nodes.
 */
TEST(HashRing, Duplicates_Collapse) {
  const BackendList set{A, B, A, A};
  const auto ring = HashRing::build(set, 20);
  EXPECT_EQ(ring.size(), 40u);
  EXPECT_EQ(ring.backend_count(), 2u);
}

/**
 * @test Same_Address_Different_Instance
 * @brief Instance id is part of identity.
 */
TEST(HashRing, Same_Address_Different_Instance) {
  const Backend a2 = backend("10.0.0.1", "00000000-0000-0000-0000-0000000000aa");
  const BackendList set{A, a2};
  EXPECT_EQ(HashRing::build(set, 20).backend_count(), 2u);
}

/**
 * @test Position_Is_Md5_Prefix
 * @brief Known MD5 digests: "" → d41d8cd9..., "abc" → 90015098...
 */
TEST(HashRing, Position_Is_Md5_Prefix) {
  EXPECT_EQ(HashRing::position(std::string_view{""}), 0xd41d8cd9u);
  EXPECT_EQ(HashRing::position(std::string_view{"abc"}), 0x90015098u);
}

/**
 * @test Digest_Available_And_Byte_Keys_Agree
 * @brief MD5 is usable, and byte and text keys of equal content share a position.
 */
TEST(HashRing, Digest_Available_And_Byte_Keys_Agree) {
  ASSERT_TRUE(HashRing::digest_available());
  const std::vector<uint8_t> abc{'a', 'b', 'c'};
  EXPECT_EQ(HashRing::position(std::span<const uint8_t>(abc)), 0x90015098u);

  const auto ring = HashRing::build(BackendList{A, B, C}, 20);
  const std::vector<uint8_t> key{'1', '0', '.', '7', '.', '7', '.', '7'};
  EXPECT_EQ(ring.pick(std::span<const uint8_t>(key)), ring.pick("10.7.7.7"));
}

/**
 * @test Virtual_Node_Keys
 * @brief Each backend owns positions of "<ip>-<instance>-<i>" for i in [0, replicas).
 */
TEST(HashRing, Virtual_Node_Keys) {
  const BackendList set{A};
  const auto ring = HashRing::build(set, 4);
  std::multiset<uint32_t> have;
  for (const auto& n : ring.nodes()) {
    EXPECT_EQ(n.backend, A);
    have.insert(n.hash);
  }
  std::multiset<uint32_t> want;
  for (int i = 0; i < 4; ++i) {
    want.insert(HashRing::position("10.0.0.1-00000000-0000-0000-0000-00000000000a-" + std::to_string(i)));
  }
  EXPECT_EQ(have, want);
  EXPECT_TRUE(std::is_sorted(ring.nodes().begin(), ring.nodes().end(),
                             [](const auto& x, const auto& y) { return x.hash < y.hash; }));
}

/**
 * @test Single_Backend_Owns_Everything
 */
TEST(HashRing, Single_Backend_Owns_Everything) {
  const BackendList set{C};
  const auto ring = HashRing::build(set, frontier::config::constants::RING_REPLICAS);
  EXPECT_EQ(ring.size(), frontier::config::constants::RING_REPLICAS);
  for (int i = 0; i < 100; ++i) {
    auto b = ring.pick(client(i));
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*b, C);
  }
}

/**
 * @test Pick_Is_Deterministic
 * @brief Same key, same ring (and an identically built ring) → same backend.
 */
TEST(HashRing, Pick_Is_Deterministic) {
  const BackendList set{A, B, C};
  const auto r1 = HashRing::build(set, 20);
  const auto r2 = HashRing::build(set, 20);
  for (int i = 0; i < 200; ++i) {
    const auto k = client(i);
    EXPECT_EQ(r1.pick(k), r1.pick(k));
    EXPECT_EQ(r1.pick(k), r2.pick(k));
  }
}

/**
 * @test Insertion_Order_Independent
 */
TEST(HashRing, Insertion_Order_Independent) {
  BackendList fwd{A, B, C, D};
  BackendList rev(fwd.rbegin(), fwd.rend());
  const auto r1 = HashRing::build(fwd, 20);
  const auto r2 = HashRing::build(rev, 20);
  ASSERT_EQ(r1.size(), r2.size());
  EXPECT_TRUE(std::equal(r1.nodes().begin(), r1.nodes().end(), r2.nodes().begin()));
}

/**
 * @test Owner_Is_First_Node_Clockwise
 * @brief Keys map to the first virtual node at or after their position, wrapping to the lowest.
 */
TEST(HashRing, Owner_Is_First_Node_Clockwise) {
  const BackendList set{A, B, C};
  const auto ring = HashRing::build(set, 20);
  const auto nodes = ring.nodes();
  for (int i = 0; i < 300; ++i) {
    const auto k = client(i);
    const uint32_t h = HashRing::position(k);
    auto it = std::lower_bound(nodes.begin(), nodes.end(), h,
                               [](const HashRing::VirtualNode& n, uint32_t v) { return n.hash < v; });
    const Backend want = (it == nodes.end()) ? nodes.front().backend : it->backend;
    EXPECT_EQ(ring.pick(k), want) << k;
  }
}

/**
 * @test Spreads_Over_Backends
 * @brief With several backends, different clients land on more than one of them.
 */
TEST(HashRing, Spreads_Over_Backends) {
  const BackendList set{A, B, C, D};
  const auto ring = HashRing::build(set, 20);
  std::set<std::string> seen;
  for (int i = 0; i < 500; ++i) seen.insert(frontier::routing::to_string(*ring.pick(client(i))));
  EXPECT_GT(seen.size(), 1u);
}

/**
 * @test Adding_Backend_Only_Moves_Keys_To_It
 */
TEST(HashRing, Adding_Backend_Only_Moves_Keys_To_It) {
  const BackendList before{A, B, C};
  const BackendList after{A, B, C, D};
  const auto r1 = HashRing::build(before, 20);
  const auto r2 = HashRing::build(after, 20);
  int moved = 0;
  for (int i = 0; i < 1000; ++i) {
    const auto k = client(i);
    const auto b1 = *r1.pick(k);
    const auto b2 = *r2.pick(k);
    if (b1 != b2) {
      EXPECT_EQ(b2, D) << k;
      ++moved;
    }
  }
  EXPECT_GT(moved, 0);
}
