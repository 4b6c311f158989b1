#pragma once
/**
 * @file coordination.hpp
 * @brief Boundary to the coordination service (hierarchical namespace + change notifications).
 *
 * The discovery watcher only talks to these interfaces. The production
 * implementation lives in zk_session.hpp; tests plug in an in-memory ensemble.
 *
 * Paths are absolute within the session's scope: a factory connects and
 * scopes every session to its environment root, so "/function" below means
 * "<environment>/function" on the server.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "frontier/compat/expected.hpp"

namespace frontier::discovery {

/// Failure classes reported by coordination operations.
enum class CoordErrc : std::uint8_t {
    ConnectionLoss = 1, ///< Lost the server connection while the call was in flight
    SessionExpired,     ///< Session is gone; a new one must be opened
    NoNode,             ///< Path does not exist
    Timeout,            ///< Connect or operation timed out
    InvalidPath,        ///< Malformed path or scope
    BadArguments,       ///< Rejected by the client library
    Closed,             ///< Handle closing or closed
    SystemError         ///< Anything else
};

/// Error value: class + library return code + context.
struct CoordError {
    CoordErrc   code{CoordErrc::SystemError};
    int         rc{0};      ///< Raw client library code (0 when not applicable)
    std::string detail;
};

const char* to_string(CoordErrc e) noexcept;

/// Kinds of change notifications.
enum class EventType : std::uint8_t {
    NodeCreated,
    NodeDeleted,
    NodeDataChanged,
    NodeChildrenChanged,
    Session
};

/// Session state carried by EventType::Session notifications.
enum class SessionState : std::uint8_t {
    Connected,
    Disconnected,
    Expired,
    Closed,
    AuthFailed
};

const char* to_string(EventType t) noexcept;
const char* to_string(SessionState s) noexcept;

/// One change notification.
struct WatchEvent {
    EventType    type{EventType::Session};
    SessionState state{SessionState::Connected};
    std::string  path;  ///< Empty for session notifications

    bool operator==(const WatchEvent&) const = default;
};

/// Payload of a data node plus its change-tracking version.
struct NodeData {
    std::vector<std::uint8_t> bytes;
    std::int32_t              version{0};
};

/**
 * @class WatchStream
 * @brief Ordered stream of notifications for one subtree subscription.
 */
class WatchStream {
public:
    virtual ~WatchStream() = default;

    /// Block until the next notification is available.
    /// After close(), returns a Session/Closed notification forever.
    virtual WatchEvent next() = 0;

    /// Wake up a blocked next() and end the stream. Safe from any thread.
    virtual void close() = 0;
};

/**
 * @class CoordinationSession
 * @brief One live session, scoped to an environment root.
 */
class CoordinationSession {
public:
    virtual ~CoordinationSession() = default;

    /// Names (not paths) of the immediate children of `path`.
    virtual frontier_detail::expected<std::vector<std::string>, CoordError>
    list_children(std::string_view path) = 0;

    /// Payload and version of the node at `path`.
    virtual frontier_detail::expected<NodeData, CoordError>
    get_data(std::string_view path) = 0;

    /// Persistent recursive subscription to `path` and everything below it.
    /// The stream must not outlive the session that created it.
    virtual frontier_detail::expected<std::unique_ptr<WatchStream>, CoordError>
    watch_recursive(std::string_view path) = 0;
};

/**
 * @class SessionFactory
 * @brief Opens brand-new sessions (connect + scope to the environment root).
 */
class SessionFactory {
public:
    virtual ~SessionFactory() = default;

    virtual frontier_detail::expected<std::unique_ptr<CoordinationSession>, CoordError>
    connect() = 0;
};

} // namespace frontier::discovery
