/**
 * @file test_discovery_watcher.cpp
 * @brief DiscoveryWatcher against an in-memory coordination ensemble.
 *
 * Validates:
 *  - Initial load: empty root, empty and populated backends nodes, bad names
 *  - Watching: create / update / delete notifications reach the directory
 *  - Supervision: session loss restarts with a brand-new session and subscription
 *  - Resync: changes made while unsubscribed are picked up, deletions pruned
 */

#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <string>

#include "frontier/codec/backend_codec.hpp"
#include "frontier/config/config_loader.hpp"
#include "frontier/discovery/discovery_watcher.hpp"
#include "frontier/obs/observability.hpp"
#include "fake_coordination.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using frontier::codec::encode_backends;
using frontier::discovery::DiscoveryErrc;
using frontier::discovery::DiscoveryWatcher;
using frontier::discovery::EventType;
using frontier::discovery::SessionState;
using frontier::routing::BackendDirectory;
using frontier::routing::BackendList;
using frontier::testing::FakeEnsemble;
using frontier::testing::FakeFactory;
using frontier::testing::backend;
using frontier::testing::eventually;
using frontier::testing::id;

namespace {

constexpr const char* F1 = "11111111-1111-1111-1111-111111111111";
constexpr const char* F2 = "22222222-2222-2222-2222-222222222222";

std::string backends_node(const char* fn) { return std::string("/function/") + fn + "/backends"; }

const BackendList ONE{backend("10.0.0.1", "aaaaaaaa-0000-0000-0000-000000000001")};
const BackendList TWO{backend("10.0.0.1", "aaaaaaaa-0000-0000-0000-000000000001"),
                      backend("10.0.0.2", "aaaaaaaa-0000-0000-0000-000000000002")};

class DiscoveryWatcherTest : public ::testing::Test {
protected:
  DiscoveryWatcherTest() {
    ensemble->create("/function");
    cfg.function_root = "/function";
    cfg.replicas = 20;
    cfg.restart_delay_ms = 20;
  }

  std::unique_ptr<DiscoveryWatcher> make_watcher(frontier::obs::Observer* observer = nullptr) {
    return std::make_unique<DiscoveryWatcher>(std::make_shared<FakeFactory>(ensemble), dir, cfg, observer);
  }

  /// Start and wait until the first subscription is live.
  std::unique_ptr<DiscoveryWatcher> start_watching() {
    auto w = make_watcher();
    w->start();
    EXPECT_TRUE(eventually([&] { return w->watching(); }));
    return w;
  }

  std::shared_ptr<FakeEnsemble> ensemble{std::make_shared<FakeEnsemble>()};
  BackendDirectory dir;
  frontier::config::DiscoveryConfig cfg;
};

} // namespace

// --------------------------- Initial load ----------------------------------

/**
 * @test InitialLoad_Empty_Root
 * @brief No function nodes: every lookup is absent.
 */
TEST_F(DiscoveryWatcherTest, InitialLoad_Empty_Root) {
  auto w = make_watcher();
  ASSERT_TRUE(w->initial_load().has_value());
  EXPECT_EQ(dir.size(), 0u);
  EXPECT_EQ(dir.get(id(F1)), nullptr);
}

/**
 * @test InitialLoad_Empty_Backends_Node
 * @brief Empty payload: function present with a zero-size ring.
 */
TEST_F(DiscoveryWatcherTest, InitialLoad_Empty_Backends_Node) {
  ensemble->create(backends_node(F1));
  auto w = make_watcher();
  ASSERT_TRUE(w->initial_load().has_value());
  auto ring = dir.get(id(F1));
  ASSERT_NE(ring, nullptr);
  EXPECT_EQ(ring->size(), 0u);
}

/**
 * @test InitialLoad_One_Backend
 * @brief One backend: ring of size replicas, every key picks it.
 */
TEST_F(DiscoveryWatcherTest, InitialLoad_One_Backend) {
  ensemble->create(backends_node(F1), encode_backends(ONE));
  auto w = make_watcher();
  ASSERT_TRUE(w->initial_load().has_value());
  auto ring = dir.get(id(F1));
  ASSERT_NE(ring, nullptr);
  EXPECT_EQ(ring->size(), cfg.replicas);
  for (const char* key : {"1.1.1.1", "10.9.8.7", "192.168.0.1"}) {
    EXPECT_EQ(ring->pick(key), ONE[0]);
  }
}

/**
 * @test InitialLoad_Function_Without_Backends_Node
 * @brief A function node with no backends child yet is skipped, not fatal.
 */
TEST_F(DiscoveryWatcherTest, InitialLoad_Function_Without_Backends_Node) {
  ensemble->create(std::string("/function/") + F1);
  ensemble->create(backends_node(F2), encode_backends(TWO));
  auto w = make_watcher();
  ASSERT_TRUE(w->initial_load().has_value());
  EXPECT_EQ(dir.get(id(F1)), nullptr);
  ASSERT_NE(dir.get(id(F2)), nullptr);
  EXPECT_EQ(dir.get(id(F2))->backend_count(), 2u);
}

/**
 * @test InitialLoad_Invalid_Child_Name_Fails
 */
TEST_F(DiscoveryWatcherTest, InitialLoad_Invalid_Child_Name_Fails) {
  ensemble->create("/function/not-a-uuid");
  auto w = make_watcher();
  auto r = w->initial_load();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, DiscoveryErrc::InvalidFunctionId);
}

/**
 * @test InitialLoad_Malformed_Payload_Fails
 */
TEST_F(DiscoveryWatcherTest, InitialLoad_Malformed_Payload_Fails) {
  ensemble->create(backends_node(F1), std::vector<uint8_t>{1, 2, 3});
  auto w = make_watcher();
  auto r = w->initial_load();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, DiscoveryErrc::Decode);
}

/**
 * @test InitialLoad_Connect_Failure
 */
TEST_F(DiscoveryWatcherTest, InitialLoad_Connect_Failure) {
  ensemble->fail_next_connects(1);
  auto w = make_watcher();
  auto r = w->initial_load();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, DiscoveryErrc::Connect);
  ASSERT_TRUE(r.error().cause.has_value());
  EXPECT_EQ(*r.error().cause, frontier::discovery::CoordErrc::ConnectionLoss);
}

/**
 * @test InitialLoad_Missing_Root_Fails
 */
TEST_F(DiscoveryWatcherTest, InitialLoad_Missing_Root_Fails) {
  ensemble->remove_tree("/function");
  auto w = make_watcher();
  auto r = w->initial_load();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, DiscoveryErrc::List);
  EXPECT_EQ(r.error().cause, frontier::discovery::CoordErrc::NoNode);
}

// --------------------------- Watching --------------------------------------

/**
 * @test Watch_Create_Update_Delete
 */
TEST_F(DiscoveryWatcherTest, Watch_Create_Update_Delete) {
  auto w = start_watching();

  ensemble->create(backends_node(F1), encode_backends(ONE));
  ASSERT_TRUE(eventually([&] { auto r = dir.get(id(F1)); return r && r->backend_count() == 1; }));

  ensemble->set(backends_node(F1), encode_backends(TWO));
  ASSERT_TRUE(eventually([&] { auto r = dir.get(id(F1)); return r && r->backend_count() == 2; }));

  ensemble->set(backends_node(F1), {});
  ASSERT_TRUE(eventually([&] { auto r = dir.get(id(F1)); return r && r->empty(); }));

  ensemble->remove_tree(std::string("/function/") + F1);
  EXPECT_TRUE(eventually([&] { return dir.get(id(F1)) == nullptr; }));

  EXPECT_EQ(w->restarts(), 0u);
}

/**
 * @test Watch_Ignores_Other_Paths
 * @brief Notifications not ending in "/backends" leave the directory alone.
 */
TEST_F(DiscoveryWatcherTest, Watch_Ignores_Other_Paths) {
  auto w = start_watching();
  const auto v0 = dir.version();
  ensemble->create(std::string("/function/") + F1 + "/metadata", {1, 2, 3});
  ensemble->create(backends_node(F2));   // sentinel: processed after the one above
  ASSERT_TRUE(eventually([&] { return dir.contains(id(F2)); }));
  EXPECT_FALSE(dir.contains(id(F1)));
  EXPECT_EQ(dir.version(), v0 + 1);
  EXPECT_EQ(w->restarts(), 0u);
}

/**
 * @test Watch_Invalid_Event_Path_Restarts
 */
TEST_F(DiscoveryWatcherTest, Watch_Invalid_Event_Path_Restarts) {
  frontier::obs::Observer* observer = frontier::obs::make_simple_observer();
  const auto restarts_before = observer->snapshot().discovery_restarts;

  auto w = make_watcher(observer);
  w->start();
  ASSERT_TRUE(eventually([&] { return w->watching(); }));

  ensemble->inject({EventType::NodeCreated, SessionState::Connected, "/function/garbage/backends"});
  ASSERT_TRUE(eventually([&] { return w->restarts() >= 1; }));
  EXPECT_TRUE(eventually([&] { return w->watching(); }));
  EXPECT_GE(observer->snapshot().discovery_restarts, restarts_before + 1);
}

// --------------------------- Session loss ----------------------------------

/**
 * @test SessionExpired_Restarts_With_New_Session
 * @brief Terminal session state ends the iteration; after the delay a new session
 *        and subscription are established and updates flow again.
 */
TEST_F(DiscoveryWatcherTest, SessionExpired_Restarts_With_New_Session) {
  auto w = start_watching();
  const int connects = ensemble->connects();

  ensemble->expire_sessions();
  ASSERT_TRUE(eventually([&] { return w->restarts() == 1; }));
  ASSERT_TRUE(eventually([&] { return ensemble->connects() > connects && w->watching(); }));
  EXPECT_EQ(ensemble->open_subscriptions(), 1u);

  ensemble->create(backends_node(F1), encode_backends(ONE));
  EXPECT_TRUE(eventually([&] { return dir.contains(id(F1)); }));
}

/**
 * @test Disconnected_Is_Terminal
 */
TEST_F(DiscoveryWatcherTest, Disconnected_Is_Terminal) {
  auto w = start_watching();
  ensemble->inject({EventType::Session, SessionState::Disconnected, {}});
  EXPECT_TRUE(eventually([&] { return w->restarts() >= 1; }));
}

/**
 * @test Connect_Failures_Keep_Retrying
 */
TEST_F(DiscoveryWatcherTest, Connect_Failures_Keep_Retrying) {
  ensemble->fail_next_connects(3);
  auto w = make_watcher();
  w->start();
  ASSERT_TRUE(eventually([&] { return w->watching(); }));
  EXPECT_EQ(w->restarts(), 3u);
  EXPECT_EQ(w->iterations(), 4u);
}

/**
 * @test Resync_After_Reconnect
 * @brief Changes made while no notifications were delivered are picked up and
 *        functions deleted meanwhile are pruned.
 */
TEST_F(DiscoveryWatcherTest, Resync_After_Reconnect) {
  ensemble->create(backends_node(F1), encode_backends(ONE));
  auto w = make_watcher();
  ASSERT_TRUE(w->initial_load().has_value());
  w->start();
  ASSERT_TRUE(eventually([&] { return w->watching(); }));

  ensemble->remove_tree_quiet(std::string("/function/") + F1);
  ensemble->create_quiet(backends_node(F2), encode_backends(TWO));
  ensemble->expire_sessions();

  ASSERT_TRUE(eventually([&] { return !dir.contains(id(F1)) && dir.contains(id(F2)); }));
  EXPECT_EQ(dir.get(id(F2))->backend_count(), 2u);
}

// --------------------------- Lifecycle -------------------------------------

/**
 * @test Stop_Is_Prompt_And_Idempotent
 */
TEST_F(DiscoveryWatcherTest, Stop_Is_Prompt_And_Idempotent) {
  auto w = start_watching();
  const auto t0 = std::chrono::steady_clock::now();
  w->stop();
  EXPECT_LT(std::chrono::steady_clock::now() - t0, 2s);
  EXPECT_FALSE(w->watching());
  w->stop();
  EXPECT_EQ(w->restarts(), 0u);
}

/**
 * @test FunctionFromPath
 */
TEST_F(DiscoveryWatcherTest, FunctionFromPath) {
  auto w = make_watcher();
  EXPECT_EQ(w->function_from_path(backends_node(F1)), id(F1));
  EXPECT_EQ(w->function_from_path(std::string("/function/") + F1), id(F1));
  EXPECT_FALSE(w->function_from_path("/function").has_value());
  EXPECT_FALSE(w->function_from_path("/functions/" + std::string(F1)).has_value());
  EXPECT_FALSE(w->function_from_path("/function/xyz/backends").has_value());
}
