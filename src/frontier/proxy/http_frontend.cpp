/**
 * @file http_frontend.cpp
 * @brief Beast/Asio coroutine server and the chunked relay between client and backend.
 */
#include "frontier/proxy/http_frontend.hpp"
#include "frontier/config/constants.hpp"
#include "frontier/obs/observability.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <limits>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/serializer.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include <spdlog/spdlog.h>

namespace frontier::proxy {
using namespace frontier::config::constants;

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = boost::beast::http;
using asio::ip::tcp;

namespace {

std::string_view to_sv(beast::string_view s) noexcept { return {s.data(), s.size()}; }

// boost::none only lifts the limit from Boost 1.75 on; older parsers compare against it.
constexpr std::uint64_t UNLIMITED_BODY = std::numeric_limits<std::uint64_t>::max();

/// 1xx other than 101 precede the final response and carry no body.
bool is_interim(unsigned status) noexcept {
    return status >= 100 && status < 200 && status != 101;
}

enum class RelayStage : std::uint8_t { Done, ReadFailed, WriteFailed };

struct RelayResult {
    RelayStage                stage{RelayStage::Done};
    boost::system::error_code ec;
};

/**
 * Stream one message body from `in` to `out` through a fixed-size buffer.
 * The header is emitted by the first write. Mirrors Beast's relay example.
 */
template <bool isRequest>
asio::awaitable<RelayResult> relay_body(beast::tcp_stream& in,
                                        beast::flat_buffer& in_buffer,
                                        http::parser<isRequest, http::buffer_body>& p,
                                        http::serializer<isRequest, http::buffer_body>& sr,
                                        beast::tcp_stream& out) {
    std::vector<char> chunk(RELAY_CHUNK_BYTES);
    boost::system::error_code ec;
    do {
        auto& body = p.get().body();
        if (!p.is_done()) {
            body.data = chunk.data();
            body.size = chunk.size();
            co_await http::async_read(in, in_buffer, p, asio::redirect_error(asio::use_awaitable, ec));
            if (ec == http::error::need_buffer) ec = {};
            if (ec) co_return RelayResult{RelayStage::ReadFailed, ec};
            body.size = chunk.size() - body.size;
            body.data = chunk.data();
            body.more = !p.is_done();
        } else {
            body.data = nullptr;
            body.size = 0;
            body.more = false;
        }

        co_await http::async_write(out, sr, asio::redirect_error(asio::use_awaitable, ec));
        if (ec == http::error::need_buffer) ec = {};
        if (ec) co_return RelayResult{RelayStage::WriteFailed, ec};
    } while (!p.is_done() || !sr.is_done());
    co_return RelayResult{};
}

/// Small plain-text response generated by the front end itself.
asio::awaitable<bool> reply(beast::tcp_stream& client, unsigned version, bool keep_alive,
                            unsigned status, std::string body, const std::string& traceparent) {
    http::response<http::string_body> res{static_cast<http::status>(status), version};
    res.set(http::field::content_type, "text/plain");
    if (!traceparent.empty()) res.set(TRACEPARENT_HEADER, traceparent);
    res.keep_alive(keep_alive);
    res.body() = std::move(body);
    res.prepare_payload();

    boost::system::error_code ec;
    co_await http::async_write(client, res, asio::redirect_error(asio::use_awaitable, ec));
    co_return !ec && keep_alive;
}

obs::RouteOutcome outcome_of(RouteErr e) noexcept {
    switch (e) {
        case RouteErr::NotFound:      return obs::RouteOutcome::NotFound;
        case RouteErr::Unavailable:   return obs::RouteOutcome::Unavailable;
        case RouteErr::UpstreamError: return obs::RouteOutcome::UpstreamError;
        case RouteErr::BadRequest:    return obs::RouteOutcome::BadRequest;
    }
    return obs::RouteOutcome::UpstreamError;
}

void log_unhandled(std::exception_ptr e) {
    if (!e) return;
    try {
        std::rethrow_exception(e);
    } catch (const std::exception& ex) {
        spdlog::error("Connection handler failed: {}", ex.what());
    }
}

} // namespace

HttpFrontend::HttpFrontend(asio::io_context& ioc,
                           const routing::BackendDirectory& directory,
                           config::HttpConfig cfg,
                           obs::Observer* observer)
    : ioc_(ioc),
      acceptor_(asio::make_strand(ioc)),
      router_(directory, cfg.backend_port),
      cfg_(std::move(cfg)),
      observer_(observer) {}

frontier_detail::expected<void, boost::system::error_code> HttpFrontend::start() {
    boost::system::error_code ec;
    const auto address = asio::ip::make_address(cfg_.bind_address, ec);
    if (ec) return frontier_detail::unexpected(ec);

    const tcp::endpoint ep(address, cfg_.bind_port);
    acceptor_.open(ep.protocol(), ec);
    if (ec) return frontier_detail::unexpected(ec);
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (ec) return frontier_detail::unexpected(ec);
    acceptor_.bind(ep, ec);
    if (ec) return frontier_detail::unexpected(ec);
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) return frontier_detail::unexpected(ec);

    const auto bound = acceptor_.local_endpoint(ec);
    spdlog::info("Listening on {}:{}", bound.address().to_string(), bound.port());

    asio::co_spawn(acceptor_.get_executor(), accept_loop(), log_unhandled);
    return {};
}

void HttpFrontend::stop() {
    asio::post(acceptor_.get_executor(), [this] {
        boost::system::error_code ec;
        acceptor_.close(ec);
        if (ec) spdlog::warn("Closing listener: {}", ec.message());
    });
}

tcp::endpoint HttpFrontend::local_endpoint() const {
    boost::system::error_code ec;
    return acceptor_.local_endpoint(ec);
}

asio::awaitable<void> HttpFrontend::accept_loop() {
    for (;;) {
        boost::system::error_code ec;
        // Each connection gets its own strand: the session coroutine, its
        // upstream stream and their timers then never run concurrently.
        tcp::socket socket(asio::make_strand(ioc_));
        co_await acceptor_.async_accept(socket, asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            if (ec == asio::error::operation_aborted || !acceptor_.is_open()) break;
            spdlog::warn("Accept failed: {}", ec.message());
            continue;
        }
        const auto executor = socket.get_executor();
        asio::co_spawn(executor, session(std::move(socket)), log_unhandled);
    }
    spdlog::info("Listener closed");
}

asio::awaitable<void> HttpFrontend::session(tcp::socket socket) {
    boost::system::error_code ec;
    const auto peer = socket.remote_endpoint(ec);
    const std::string client_ip = ec ? std::string() : peer.address().to_string();

    beast::tcp_stream client(std::move(socket));
    beast::flat_buffer buffer;

    for (;;) {
        RequestParser parser;
        parser.body_limit(UNLIMITED_BODY);
        co_await http::async_read_header(client, buffer, parser, asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            if (ec != http::error::end_of_stream) spdlog::debug("Client {} read failed: {}", client_ip, ec.message());
            break;
        }
        if (!co_await handle(client, buffer, parser, client_ip)) break;
    }

    client.socket().shutdown(tcp::socket::shutdown_send, ec);
}

asio::awaitable<bool> HttpFrontend::handle(beast::tcp_stream& client,
                                           beast::flat_buffer& buffer,
                                           RequestParser& parser,
                                           const std::string& client_ip) {
    const auto started = std::chrono::steady_clock::now();
    auto& req = parser.get();
    const unsigned version = req.version();
    const bool client_keep_alive = req.keep_alive();
    const std::string target(to_sv(req.target()));

    if (req.method() == http::verb::get && target.substr(0, target.find('?')) == HEALTHZ_PATH) {
        co_return co_await reply(client, version, client_keep_alive && parser.is_done(), 200,
                                 HEALTHZ_BODY, std::string());
    }

    const TraceContext trace = continue_trace(to_sv(req[TRACEPARENT_HEADER]), to_sv(req[TRACESTATE_HEADER]));
    const std::string traceparent = trace.to_traceparent();

    obs::RouteEvent ev;
    ev.client_ip = client_ip;
    ev.trace_id  = trace.trace_id_hex();
    auto finish = [&](obs::RouteOutcome outcome, unsigned status) {
        ev.outcome = outcome;
        ev.status = status;
        ev.latency_us = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - started).count());
        if (observer_) observer_->record(ev);
    };
    // The unread body would be parsed as the next request.
    const bool reusable = client_keep_alive && parser.is_done();

    const auto route = parse_invoke_target(target);
    if (!route) {
        finish(outcome_of(route.error()), http_status(route.error()));
        co_return co_await reply(client, version, reusable, http_status(route.error()),
                                 to_string(route.error()), traceparent);
    }
    ev.function_id = routing::to_string(route->function_id);

    const auto backend = router_.pick(route->function_id, client_ip);
    if (!backend) {
        spdlog::debug("No backend for function {}: {}", ev.function_id, to_string(backend.error()));
        finish(outcome_of(backend.error()), http_status(backend.error()));
        co_return co_await reply(client, version, reusable, http_status(backend.error()),
                                 to_string(backend.error()), traceparent);
    }
    ev.backend = routing::to_string(*backend);

    const Exchange ex = co_await forward(client, buffer, parser, *backend, *route, trace, client_keep_alive);
    if (ex.client_gone) {
        finish(ex.responded ? obs::RouteOutcome::Routed : obs::RouteOutcome::UpstreamError, ex.status);
        co_return false;
    }
    if (!ex.responded) {
        const unsigned status = http_status(RouteErr::UpstreamError);
        finish(obs::RouteOutcome::UpstreamError, status);
        co_return co_await reply(client, version, ex.keep_alive, status,
                                 to_string(RouteErr::UpstreamError), traceparent);
    }
    finish(obs::RouteOutcome::Routed, ex.status);
    co_return ex.keep_alive;
}

asio::awaitable<HttpFrontend::Exchange> HttpFrontend::forward(beast::tcp_stream& client,
                                                              beast::flat_buffer& buffer,
                                                              RequestParser& parser,
                                                              const routing::Backend& backend,
                                                              const InvokeRoute& route,
                                                              const TraceContext& trace,
                                                              bool client_keep_alive) {
    Exchange ex;
    auto& req = parser.get();
    boost::system::error_code ec;

    const tcp::endpoint ep(asio::ip::address(backend.ip), router_.backend_port());
    beast::tcp_stream upstream(co_await asio::this_coro::executor);
    upstream.expires_after(std::chrono::milliseconds(cfg_.connect_timeout_ms));
    co_await upstream.async_connect(ep, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        spdlog::error("Upstream connect to {}:{} failed: {}", ep.address().to_string(), ep.port(), ec.message());
        ex.keep_alive = client_keep_alive && parser.is_done();
        co_return ex;
    }
    upstream.expires_never();

    const bool head = req.method() == http::verb::head;
    const std::string traceparent = trace.to_traceparent();
    req.target(Router::upstream_target(backend, route.suffix, route.query));
    req.set(http::field::host, router_.authority(backend));
    req.set(TRACEPARENT_HEADER, traceparent);
    if (!trace.tracestate.empty()) req.set(TRACESTATE_HEADER, trace.tracestate);
    req.keep_alive(false);

    {
        http::request_serializer<http::buffer_body> sr{req};
        const auto r = co_await relay_body(client, buffer, parser, sr, upstream);
        if (r.stage == RelayStage::ReadFailed) {
            spdlog::debug("Client request body aborted: {}", r.ec.message());
            ex.client_gone = true;
            co_return ex;
        }
        if (r.stage == RelayStage::WriteFailed) {
            spdlog::error("Upstream {} request write failed: {}", ep.address().to_string(), r.ec.message());
            co_return ex;
        }
    }

    beast::flat_buffer upstream_buffer;
    std::optional<http::response_parser<http::buffer_body>> rp;
    for (;;) {
        rp.emplace();
        rp->body_limit(UNLIMITED_BODY);
        if (head) rp->skip(true);
        co_await http::async_read_header(upstream, upstream_buffer, *rp, asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            spdlog::error("Upstream {} response header failed: {}", ep.address().to_string(), ec.message());
            ex.keep_alive = client_keep_alive;
            co_return ex;
        }
        if (!is_interim(rp->get().result_int())) break;
        spdlog::trace("Dropping interim {} from upstream {}", rp->get().result_int(), ep.address().to_string());
    }

    auto& res = rp->get();
    ex.status = res.result_int();
    // A body delimited by EOF can only be passed on the same way.
    ex.keep_alive = client_keep_alive && !rp->need_eof();
    res.keep_alive(ex.keep_alive);
    res.set(TRACEPARENT_HEADER, traceparent);

    http::response_serializer<http::buffer_body> rsr{res};
    const auto r = co_await relay_body(upstream, upstream_buffer, *rp, rsr, client);
    ex.responded = true;
    if (r.stage == RelayStage::Done) co_return ex;

    ex.keep_alive = false;
    if (r.stage == RelayStage::ReadFailed) {
        spdlog::error("Upstream {} response aborted: {}", ep.address().to_string(), r.ec.message());
        ex.responded = rsr.is_header_done();
    } else {
        spdlog::debug("Client response write failed: {}", r.ec.message());
        ex.client_gone = true;
    }
    co_return ex;
}

} // namespace frontier::proxy
