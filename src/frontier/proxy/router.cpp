/**
 * @file router.cpp
 */
#include "frontier/proxy/router.hpp"
#include "frontier/config/constants.hpp"

namespace frontier::proxy {
using namespace frontier::config::constants;

const char* to_string(RouteErr e) noexcept {
    switch (e) {
        case RouteErr::NotFound:      return "Not Found";
        case RouteErr::Unavailable:   return "Service Unavailable";
        case RouteErr::UpstreamError: return "Bad Gateway";
        case RouteErr::BadRequest:    return "Bad Request";
    }
    return "Internal Server Error";
}

unsigned http_status(RouteErr e) noexcept {
    switch (e) {
        case RouteErr::NotFound:      return 404;
        case RouteErr::Unavailable:   return 503;
        case RouteErr::UpstreamError: return 502;
        case RouteErr::BadRequest:    return 400;
    }
    return 500;
}

frontier_detail::expected<InvokeRoute, RouteErr> parse_invoke_target(std::string_view target) {
    InvokeRoute route;

    if (const auto q = target.find('?'); q != std::string_view::npos) {
        route.query = std::string(target.substr(q + 1));
        target = target.substr(0, q);
    }

    const std::string_view prefix = INVOKE_PREFIX;
    if (target.substr(0, prefix.size()) != prefix) return frontier_detail::unexpected(RouteErr::NotFound);
    target.remove_prefix(prefix.size());

    const auto slash = target.find('/');
    const std::string_view id_text = target.substr(0, slash);
    if (id_text.empty()) return frontier_detail::unexpected(RouteErr::NotFound);

    const auto id = routing::parse_function_id(id_text);
    if (!id) return frontier_detail::unexpected(RouteErr::BadRequest);
    route.function_id = *id;

    if (slash != std::string_view::npos) route.suffix = std::string(target.substr(slash + 1));
    return route;
}

frontier_detail::expected<routing::Backend, RouteErr>
Router::pick(const routing::FunctionId& function_id, std::string_view client_ip) const {
    const auto ring = directory_.get(function_id);
    if (!ring) return frontier_detail::unexpected(RouteErr::NotFound);

    auto backend = ring->pick(client_ip);
    if (!backend) return frontier_detail::unexpected(RouteErr::Unavailable);
    return *backend;
}

std::string Router::upstream_target(const routing::Backend& b,
                                    std::string_view suffix,
                                    std::string_view query) {
    std::string target;
    target.reserve(std::string_view(INVOKE_PREFIX).size() + 37 + suffix.size() + query.size() + 1);
    target += INVOKE_PREFIX;
    target += routing::to_string(b.instance_id);
    target += '/';
    target += suffix;
    if (!query.empty()) {
        target += '?';
        target += query;
    }
    return target;
}

std::string Router::authority(const routing::Backend& b) const {
    return b.ip.to_string() + ":" + std::to_string(backend_port_);
}

} // namespace frontier::proxy
