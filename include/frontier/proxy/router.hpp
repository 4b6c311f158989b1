#pragma once
/**
 * @file router.hpp
 * @brief Routing decision for /invoke/ requests: target parsing, backend pick, upstream target.
 * @details No I/O. The directory snapshot current at call time is used.
 */

#include <cstdint>
#include <string>
#include <string_view>

#include "frontier/compat/expected.hpp"
#include "frontier/routing/backend.hpp"
#include "frontier/routing/backend_directory.hpp"

namespace frontier::proxy {

/**
 * @enum RouteErr
 * @brief Closed set of routing failures, mapped to a status by http_status().
 */
enum class RouteErr : std::uint8_t {
    NotFound = 1,   ///< Unknown function or no such route
    Unavailable,    ///< Function known but without backends
    UpstreamError,  ///< Backend connect/exchange failed
    BadRequest      ///< Malformed function id
};

/// Short plain-text reason (also used as the response body).
const char* to_string(RouteErr e) noexcept;

/// 404 / 503 / 502 / 400.
unsigned http_status(RouteErr e) noexcept;

/**
 * @struct InvokeRoute
 * @brief Pieces of an "/invoke/{id}[/{suffix}][?query]" target.
 */
struct InvokeRoute {
    routing::FunctionId function_id{};
    std::string         suffix;  ///< Path after "/invoke/{id}/", without leading slash
    std::string         query;   ///< Text after '?', empty when absent

    bool operator==(const InvokeRoute&) const = default;
};

/**
 * @brief Match a request target against the invoke routes.
 * @return BadRequest when the id segment is not a UUID, NotFound for any other shape.
 */
frontier_detail::expected<InvokeRoute, RouteErr> parse_invoke_target(std::string_view target);

/**
 * @class Router
 * @brief Picks a backend for (function, client) from the backend directory.
 */
class Router {
public:
    Router(const routing::BackendDirectory& directory, std::uint16_t backend_port) noexcept
        : directory_(directory), backend_port_(backend_port) {}

    /**
     * @brief Sticky pick keyed by the client address.
     * @return NotFound when the function is absent, Unavailable when its ring is empty.
     */
    [[nodiscard]] frontier_detail::expected<routing::Backend, RouteErr>
    pick(const routing::FunctionId& function_id, std::string_view client_ip) const;

    /// "/invoke/{instance}/{suffix}[?query]"
    [[nodiscard]] static std::string upstream_target(const routing::Backend& b,
                                                     std::string_view suffix,
                                                     std::string_view query);

    /// "{ip}:{backend_port}" for the Host header.
    [[nodiscard]] std::string authority(const routing::Backend& b) const;

    [[nodiscard]] std::uint16_t backend_port() const noexcept { return backend_port_; }

private:
    const routing::BackendDirectory& directory_;
    std::uint16_t backend_port_;
};

} // namespace frontier::proxy
