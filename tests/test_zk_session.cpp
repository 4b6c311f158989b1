/**
 * @file test_zk_session.cpp
 * @brief ZooKeeper adapter: return-code and state mapping, and a live ensemble run.
 *
 * Validates:
 *  - Client return codes and ZOO_*_STATE values map onto the coordination enums
 *  - Environment names usable as a chroot segment
 *  - Against a real ensemble (ZOOKEEPER_CLUSTER="host:port,..."): initial load,
 *    create / repeated update / delete of backends nodes reach the directory
 *    through ZooKeeperSessionFactory and DiscoveryWatcher
 *
 * The live cases are skipped when ZOOKEEPER_CLUSTER is not set.
 */

#include <gtest/gtest.h>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include <zookeeper/zookeeper.h>

#include "frontier/codec/backend_codec.hpp"
#include "frontier/config/config_loader.hpp"
#include "frontier/discovery/discovery_watcher.hpp"
#include "frontier/discovery/zk_session.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using frontier::codec::encode_backends;
using frontier::discovery::CoordErrc;
using frontier::discovery::DiscoveryWatcher;
using frontier::discovery::SessionState;
using frontier::discovery::ZooKeeperSessionFactory;
using frontier::discovery::classify_zk_error;
using frontier::discovery::session_state_of;
using frontier::discovery::valid_environment;
using frontier::routing::BackendDirectory;
using frontier::routing::BackendList;
using frontier::testing::backend;
using frontier::testing::eventually;
using frontier::testing::id;

// --------------------------- Mapping ---------------------------------------

/**
 * @test Return_Codes
 */
TEST(ZkMapping, Return_Codes) {
  EXPECT_EQ(classify_zk_error(ZNONODE), CoordErrc::NoNode);
  EXPECT_EQ(classify_zk_error(ZCONNECTIONLOSS), CoordErrc::ConnectionLoss);
  EXPECT_EQ(classify_zk_error(ZSESSIONEXPIRED), CoordErrc::SessionExpired);
  EXPECT_EQ(classify_zk_error(ZOPERATIONTIMEOUT), CoordErrc::Timeout);
  EXPECT_EQ(classify_zk_error(ZBADARGUMENTS), CoordErrc::BadArguments);
  EXPECT_EQ(classify_zk_error(ZCLOSING), CoordErrc::Closed);
  EXPECT_EQ(classify_zk_error(ZINVALIDSTATE), CoordErrc::Closed);
  EXPECT_EQ(classify_zk_error(ZMARSHALLINGERROR), CoordErrc::SystemError);
}

/**
 * @test Session_States
 * @brief Anything short of an established session is a disconnect.
 */
TEST(ZkMapping, Session_States) {
  EXPECT_EQ(session_state_of(ZOO_CONNECTED_STATE), SessionState::Connected);
  EXPECT_EQ(session_state_of(ZOO_EXPIRED_SESSION_STATE), SessionState::Expired);
  EXPECT_EQ(session_state_of(ZOO_AUTH_FAILED_STATE), SessionState::AuthFailed);
  EXPECT_EQ(session_state_of(ZOO_CONNECTING_STATE), SessionState::Disconnected);
  EXPECT_EQ(session_state_of(ZOO_ASSOCIATING_STATE), SessionState::Disconnected);
  EXPECT_EQ(session_state_of(0), SessionState::Closed);
}

/**
 * @test Environment_Names
 */
TEST(ZkMapping, Environment_Names) {
  EXPECT_TRUE(valid_environment("default"));
  EXPECT_TRUE(valid_environment("prod-eu.1"));
  EXPECT_FALSE(valid_environment(""));
  EXPECT_FALSE(valid_environment("."));
  EXPECT_FALSE(valid_environment(".."));
  EXPECT_FALSE(valid_environment("a/b"));
  EXPECT_FALSE(valid_environment(std::string("a\x01", 2)));
}

/**
 * @test Invalid_Environment_Refused_Before_Connecting
 */
TEST(ZkMapping, Invalid_Environment_Refused_Before_Connecting) {
  ZooKeeperSessionFactory factory({"127.0.0.1:1", "a/b", 1000});
  auto s = factory.connect();
  ASSERT_FALSE(s.has_value());
  EXPECT_EQ(s.error().code, CoordErrc::InvalidPath);
}

// --------------------------- Live ensemble ---------------------------------

namespace {

constexpr const char* FN = "5a5a5a5a-0000-4000-8000-000000000001";

const BackendList ONE{backend("10.9.0.1", "bbbbbbbb-0000-0000-0000-000000000001")};
const BackendList TWO{backend("10.9.0.1", "bbbbbbbb-0000-0000-0000-000000000001"),
                      backend("10.9.0.2", "bbbbbbbb-0000-0000-0000-000000000002")};

void ignore_events(zhandle_t*, int, int, const char*, void*) {}

/// Writer-side client used to drive the ensemble (no chroot).
class ZkAdmin {
public:
  explicit ZkAdmin(const std::string& hosts)
      : zh_(zookeeper_init(hosts.c_str(), ignore_events, 10000, nullptr, nullptr, 0)) {}
  ~ZkAdmin() {
    if (zh_) zookeeper_close(zh_);
  }
  ZkAdmin(const ZkAdmin&) = delete;
  ZkAdmin& operator=(const ZkAdmin&) = delete;

  bool connected() const { return zh_ && zoo_state(zh_) == ZOO_CONNECTED_STATE; }

  int create(const std::string& path, const std::vector<uint8_t>& data = {}) {
    const std::string bytes(data.begin(), data.end());
    return zoo_create(zh_, path.c_str(), bytes.data(), static_cast<int>(bytes.size()),
                      &ZOO_OPEN_ACL_UNSAFE, 0, nullptr, 0);
  }

  int set(const std::string& path, const std::vector<uint8_t>& data) {
    const std::string bytes(data.begin(), data.end());
    return zoo_set(zh_, path.c_str(), bytes.data(), static_cast<int>(bytes.size()), -1);
  }

  void remove_tree(const std::string& path) {
    String_vector children{};
    if (zoo_get_children(zh_, path.c_str(), 0, &children) == ZOK) {
      std::vector<std::string> names;
      for (int32_t i = 0; i < children.count; ++i) names.emplace_back(children.data[i]);
      deallocate_String_vector(&children);
      for (const auto& n : names) remove_tree(path + "/" + n);
    }
    zoo_delete(zh_, path.c_str(), -1);
  }

private:
  zhandle_t* zh_;
};

class ZkLiveTest : public ::testing::Test {
protected:
  void SetUp() override {
    const char* cluster = std::getenv("ZOOKEEPER_CLUSTER");
    if (!cluster || !*cluster) GTEST_SKIP() << "ZOOKEEPER_CLUSTER not set";

    hosts_ = cluster;
    env_ = "frontier-test-" + std::to_string(std::random_device{}());
    admin_ = std::make_unique<ZkAdmin>(hosts_);
    ASSERT_TRUE(eventually([&] { return admin_->connected(); }, 10000ms));
    ASSERT_EQ(admin_->create(chroot()), ZOK);
    ASSERT_EQ(admin_->create(chroot() + "/function"), ZOK);

    cfg_.function_root = "/function";
    cfg_.replicas = 20;
    cfg_.restart_delay_ms = 100;
  }

  void TearDown() override {
    if (watcher_) watcher_->stop();
    if (admin_) admin_->remove_tree(chroot());
  }

  std::string chroot() const { return "/" + env_; }
  std::string function_node(const char* fn) const { return chroot() + "/function/" + fn; }
  std::string backends_node(const char* fn) const { return function_node(fn) + "/backends"; }

  std::unique_ptr<DiscoveryWatcher> make_watcher() {
    auto factory = std::make_shared<ZooKeeperSessionFactory>(
        frontier::config::CoordinationConfig{hosts_, env_, 10000});
    return std::make_unique<DiscoveryWatcher>(factory, dir_, cfg_);
  }

  std::size_t ring_size(const char* fn) const {
    auto ring = dir_.get(id(fn));
    return ring ? ring->size() : 0;
  }

  std::string hosts_;
  std::string env_;
  std::unique_ptr<ZkAdmin> admin_;
  frontier::config::DiscoveryConfig cfg_;
  BackendDirectory dir_;
  std::unique_ptr<DiscoveryWatcher> watcher_;
};

} // namespace

/**
 * @test Initial_Load_Reads_Existing_Backends
 */
TEST_F(ZkLiveTest, Initial_Load_Reads_Existing_Backends) {
  ASSERT_EQ(admin_->create(function_node(FN)), ZOK);
  ASSERT_EQ(admin_->create(backends_node(FN), encode_backends(ONE)), ZOK);

  watcher_ = make_watcher();
  ASSERT_TRUE(watcher_->initial_load().has_value());
  EXPECT_EQ(ring_size(FN), 20u);
  EXPECT_EQ(dir_.get(id(FN))->pick("192.0.2.1"), ONE[0]);
}

/**
 * @test Watch_Create_Update_Delete
 * @brief Empty node, one backend, two backends, then removal, all picked up live.
 */
TEST_F(ZkLiveTest, Watch_Create_Update_Delete) {
  watcher_ = make_watcher();
  ASSERT_TRUE(watcher_->initial_load().has_value());
  watcher_->start();
  ASSERT_TRUE(eventually([&] { return watcher_->watching(); }, 10000ms));
  EXPECT_EQ(dir_.get(id(FN)), nullptr);

  // Function node and an empty backends node: present, nothing to route to.
  ASSERT_EQ(admin_->create(function_node(FN)), ZOK);
  ASSERT_EQ(admin_->create(backends_node(FN)), ZOK);
  ASSERT_TRUE(eventually([&] { return dir_.get(id(FN)) != nullptr; }, 10000ms));
  EXPECT_EQ(ring_size(FN), 0u);

  // Consecutive writes each land: the data watch is re-armed every time.
  ASSERT_EQ(admin_->set(backends_node(FN), encode_backends(ONE)), ZOK);
  ASSERT_TRUE(eventually([&] { return ring_size(FN) == 20u; }, 10000ms));
  ASSERT_EQ(admin_->set(backends_node(FN), encode_backends(TWO)), ZOK);
  ASSERT_TRUE(eventually([&] { return ring_size(FN) == 40u; }, 10000ms));

  admin_->remove_tree(function_node(FN));
  EXPECT_TRUE(eventually([&] { return dir_.get(id(FN)) == nullptr; }, 10000ms));
  EXPECT_EQ(watcher_->restarts(), 0u);
}
