#pragma once
/**
 * @file http_frontend.hpp
 * @brief HTTP/1.1 front end: /healthz, /invoke/ routing and streaming relay to backends.
 *
 * One coroutine per inbound connection, each on its own strand of a shared
 * io_context (which may be run by several threads). Each routed
 * request opens its own upstream connection (Connection: close), relays the
 * request body in chunks, then relays the final response header and body
 * back; interim 1xx responses from the backend are dropped. Bodies are never
 * buffered whole.
 */

#include <memory>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/system/error_code.hpp>

#include "frontier/compat/expected.hpp"
#include "frontier/config/config_loader.hpp"
#include "frontier/proxy/router.hpp"
#include "frontier/proxy/trace_context.hpp"
#include "frontier/routing/backend_directory.hpp"

namespace frontier::obs { class Observer; }

namespace frontier::proxy {

class HttpFrontend final {
public:
    HttpFrontend(boost::asio::io_context& ioc,
                 const routing::BackendDirectory& directory,
                 config::HttpConfig cfg,
                 obs::Observer* observer = nullptr);

    HttpFrontend(const HttpFrontend&) = delete;
    HttpFrontend& operator=(const HttpFrontend&) = delete;

    /// Bind, listen and spawn the accept loop. Port 0 picks an ephemeral port.
    frontier_detail::expected<void, boost::system::error_code> start();

    /// Close the acceptor; connections in flight finish on their own.
    void stop();

    /// Bound address (valid after start()).
    [[nodiscard]] boost::asio::ip::tcp::endpoint local_endpoint() const;

private:
    using RequestParser = boost::beast::http::request_parser<boost::beast::http::buffer_body>;

    /// What happened to one proxied exchange.
    struct Exchange {
        bool     keep_alive{false};   ///< Client connection may serve another request
        bool     responded{false};    ///< Response header went (or was offered) to the client
        bool     client_gone{false};  ///< Reading the request body from the client failed
        unsigned status{0};           ///< Backend status when responded
    };

    boost::asio::awaitable<void> accept_loop();
    boost::asio::awaitable<void> session(boost::asio::ip::tcp::socket socket);

    /// Handle one request whose header has been read. Returns whether to keep the connection.
    boost::asio::awaitable<bool> handle(boost::beast::tcp_stream& client,
                                        boost::beast::flat_buffer& buffer,
                                        RequestParser& parser,
                                        const std::string& client_ip);

    /// Connect to `backend`, relay request and response. Never writes an error response itself.
    boost::asio::awaitable<Exchange> forward(boost::beast::tcp_stream& client,
                                             boost::beast::flat_buffer& buffer,
                                             RequestParser& parser,
                                             const routing::Backend& backend,
                                             const InvokeRoute& route,
                                             const TraceContext& trace,
                                             bool client_keep_alive);

    boost::asio::io_context&       ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    Router                         router_;
    config::HttpConfig             cfg_;
    obs::Observer*                 observer_;
};

} // namespace frontier::proxy
