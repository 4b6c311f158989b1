#pragma once
/**
 * @file discovery_watcher.hpp
 * @brief Keeps the BackendDirectory synchronized with the coordination namespace.
 *
 * Namespace layout (relative to the environment root):
 *
 *   /function/<function-uuid>/backends   ← encoded backend list
 *
 * Lifecycle:
 *   1. initial_load()  - full scan on a fresh session; failures are fatal to startup.
 *   2. start()         - supervisor thread: run_once() forever, fixed delay after each failure.
 *   3. stop()          - wake the thread and join it.
 *
 * run_once() state machine: Connected (new session, subscription, resync)
 * → Watching (apply notifications) → returns an error on session loss or on
 * any discovery failure. It never succeeds and contains no retry logic.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "frontier/compat/expected.hpp"
#include "frontier/config/config_loader.hpp"
#include "frontier/discovery/coordination.hpp"
#include "frontier/routing/backend.hpp"
#include "frontier/routing/backend_directory.hpp"

namespace frontier::obs { class Observer; }

namespace frontier::discovery {

/// Failure classes of one watcher iteration (or of the initial load).
enum class DiscoveryErrc : std::uint8_t {
    Connect = 1,        ///< Could not open or scope a session
    Subscribe,          ///< Could not register the subtree subscription
    List,               ///< Could not list the function root
    Fetch,              ///< Could not read a backends node
    Decode,             ///< Backends payload is malformed
    InvalidFunctionId,  ///< A child name / event path is not a function UUID
    SessionLost,        ///< Session reported Disconnected/Expired/Closed
    Stopped             ///< stop() was requested
};

const char* to_string(DiscoveryErrc e) noexcept;

struct DiscoveryError {
    DiscoveryErrc            code{DiscoveryErrc::Connect};
    std::optional<CoordErrc> cause;  ///< Underlying coordination error, when there is one
    std::string              detail;
};

class DiscoveryWatcher final {
public:
    /**
     * @param factory   Opens brand-new sessions (one per iteration).
     * @param directory Directory this watcher is the only writer of.
     * @param cfg       Namespace root, replica count and restart delay.
     * @param observer  Optional counters sink (restarts).
     */
    DiscoveryWatcher(std::shared_ptr<SessionFactory> factory,
                     routing::BackendDirectory& directory,
                     config::DiscoveryConfig cfg,
                     obs::Observer* observer = nullptr);

    /// Calls stop().
    ~DiscoveryWatcher();

    DiscoveryWatcher(const DiscoveryWatcher&) = delete;
    DiscoveryWatcher& operator=(const DiscoveryWatcher&) = delete;

    /// Startup scan. Connect/list/parse failures are returned and must abort startup.
    frontier_detail::expected<void, DiscoveryError> initial_load();

    /// Spawn the supervisor thread. No-op when already running.
    void start();

    /// Stop the supervisor and join it. Idempotent.
    void stop();

    /// One watch iteration. Only returns on failure (or DiscoveryErrc::Stopped).
    frontier_detail::expected<void, DiscoveryError> run_once();

    /// Re-read one function's backends node and publish a new ring.
    frontier_detail::expected<void, DiscoveryError>
    load_backends(CoordinationSession& session, const routing::FunctionId& function_id);

    /// Function id encoded in "<root>/<id>/..." or nullopt.
    [[nodiscard]] std::optional<routing::FunctionId> function_from_path(std::string_view path) const;

    // --------------------------- Introspection -------------------------------
    /// Iterations started by the supervisor (sessions opened for watching).
    [[nodiscard]] uint64_t iterations() const noexcept { return iterations_.load(std::memory_order_relaxed); }
    /// Iterations that ended with an error and were restarted.
    [[nodiscard]] uint64_t restarts() const noexcept { return restarts_.load(std::memory_order_relaxed); }
    /// True while an iteration is in the Watching state.
    [[nodiscard]] bool watching() const noexcept { return watching_.load(std::memory_order_acquire); }

private:
    /// List the root, reload every function, drop functions no longer listed.
    frontier_detail::expected<void, DiscoveryError> scan(CoordinationSession& session);

    /// Apply one notification to the directory.
    frontier_detail::expected<void, DiscoveryError>
    apply(CoordinationSession& session, const WatchEvent& ev);

    std::string backends_path(const routing::FunctionId& function_id) const;

    void supervise();

    std::shared_ptr<SessionFactory> factory_;
    routing::BackendDirectory&      directory_;
    config::DiscoveryConfig         cfg_;
    obs::Observer*                  observer_;

    std::thread             worker_;
    std::atomic<bool>       stopping_{false};
    std::mutex              mu_;            ///< Guards active_stream_ and the restart delay wait
    std::condition_variable cv_;
    WatchStream*            active_stream_{nullptr};

    std::atomic<uint64_t> iterations_{0};
    std::atomic<uint64_t> restarts_{0};
    std::atomic<bool>     watching_{false};
};

} // namespace frontier::discovery
