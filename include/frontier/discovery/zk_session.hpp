#pragma once
/**
 * @file zk_session.hpp
 * @brief Coordination boundary implemented on the ZooKeeper C client (multi-threaded flavour).
 *
 * Sessions are chrooted to "/<environment>". Synchronous calls made by the
 * discovery watcher are serialized per session. The recursive subscription is
 * built from re-armed one-shot watches:
 *   - a child watch on the subscribed root (functions appearing/disappearing),
 *   - an exists/data watch on every "<root>/<function>/backends" node.
 * Watch callbacks run on the client's completion thread and only use the
 * asynchronous API (synchronous calls from that thread would deadlock).
 */

#include <memory>
#include <string>

#include "frontier/config/config_loader.hpp"
#include "frontier/discovery/coordination.hpp"

namespace frontier::discovery {

/**
 * @class ZooKeeperSessionFactory
 * @brief Opens a new ZooKeeper session per connect() call.
 */
class ZooKeeperSessionFactory final : public SessionFactory {
public:
    explicit ZooKeeperSessionFactory(config::CoordinationConfig cfg);

    /// Connect, wait for the session to be established, scope to the environment.
    frontier_detail::expected<std::unique_ptr<CoordinationSession>, CoordError>
    connect() override;

private:
    config::CoordinationConfig cfg_;
};

/// True when `environment` can be used as a single chroot path segment.
[[nodiscard]] bool valid_environment(const std::string& environment) noexcept;

/// Map a ZooKeeper C client return code (ZNONODE, ZCONNECTIONLOSS, ...) onto CoordErrc.
[[nodiscard]] CoordErrc classify_zk_error(int rc) noexcept;

/// Map a ZOO_*_STATE value onto SessionState. CONNECTING/ASSOCIATING count as Disconnected.
[[nodiscard]] SessionState session_state_of(int zk_state) noexcept;

} // namespace frontier::discovery
