#pragma once
/**
 * @file observability.hpp
 * @brief Observability facade: per-request route events, discovery restarts, counters.
 * @details Events are logged through the spdlog default logger; init_logging() installs it.
 */

#include <cstdint>
#include <string>
#include <string_view>

namespace frontier::obs {

    /** @enum RouteOutcome
     *  @brief Final classification of one proxied request.
     */
    enum class RouteOutcome : std::uint8_t {
        Routed,         ///< Forwarded to a backend (whatever the backend answered)
        NotFound,       ///< Unknown function or unmatched path
        Unavailable,    ///< Function known but has no backends
        UpstreamError,  ///< Backend unreachable or failed before the response started
        BadRequest      ///< Malformed function id
    };

    const char* to_string(RouteOutcome o) noexcept;

    /** @struct Counters
     *  @brief Process-level counters.
     */
    struct Counters {
        uint64_t requests{0};            ///< Requests seen on /invoke/
        uint64_t routed{0};
        uint64_t not_found{0};
        uint64_t unavailable{0};
        uint64_t upstream_errors{0};
        uint64_t bad_requests{0};
        uint64_t discovery_restarts{0};  ///< Watcher iterations that ended in an error
    };

    /** @struct RouteEvent
     *  @brief Payload describing a single routing decision.
     */
    struct RouteEvent {
        std::string  function_id;   ///< As it appeared in the path
        std::string  client_ip;
        std::string  backend;       ///< "ip-uuid" when one was picked
        std::string  trace_id;      ///< 32 hex chars
        RouteOutcome outcome{RouteOutcome::Routed};
        unsigned     status{0};     ///< HTTP status returned to the client
        uint64_t     latency_us{0};
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single request outcome.
        virtual void record(const RouteEvent& e) = 0;
        /// Record one supervised restart of the discovery loop.
        virtual void record_discovery_restart(std::string_view reason) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Process-wide observer that counts and logs through spdlog.
    Observer* make_simple_observer();

    /// Install a colored stdout logger as the spdlog default, at `level`.
    void init_logging(std::string_view level);

} // namespace frontier::obs
