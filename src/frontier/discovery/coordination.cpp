/**
 * @file coordination.cpp
 * @brief Names for coordination enums (logging only).
 */
#include "frontier/discovery/coordination.hpp"

namespace frontier::discovery {

const char* to_string(CoordErrc e) noexcept {
    switch (e) {
        case CoordErrc::ConnectionLoss: return "connection_loss";
        case CoordErrc::SessionExpired: return "session_expired";
        case CoordErrc::NoNode:         return "no_node";
        case CoordErrc::Timeout:        return "timeout";
        case CoordErrc::InvalidPath:    return "invalid_path";
        case CoordErrc::BadArguments:   return "bad_arguments";
        case CoordErrc::Closed:         return "closed";
        case CoordErrc::SystemError:    return "system_error";
    }
    return "unknown";
}

const char* to_string(EventType t) noexcept {
    switch (t) {
        case EventType::NodeCreated:         return "node_created";
        case EventType::NodeDeleted:         return "node_deleted";
        case EventType::NodeDataChanged:     return "node_data_changed";
        case EventType::NodeChildrenChanged: return "node_children_changed";
        case EventType::Session:             return "session";
    }
    return "unknown";
}

const char* to_string(SessionState s) noexcept {
    switch (s) {
        case SessionState::Connected:    return "connected";
        case SessionState::Disconnected: return "disconnected";
        case SessionState::Expired:      return "expired";
        case SessionState::Closed:       return "closed";
        case SessionState::AuthFailed:   return "auth_failed";
    }
    return "unknown";
}

} // namespace frontier::discovery
