/**
 * @file main.cpp
 * @brief frontier_fe: function-routing front end.
 *
 * **Bootstrap**
 * - Parse options, initialize logging.
 * - Initial load of the backend directory from ZooKeeper (fatal on failure).
 *
 * **Discovery**
 * - Supervised watcher thread keeps the directory current; restarts forever.
 *
 * **Data plane**
 * - HTTP front end on a shared io_context, `--threads` runners.
 *
 * **Lifecycle**
 * - SIGINT/SIGTERM close the listener, stop the io_context and join the watcher.
 */

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include "frontier/config/config_loader.hpp"
#include "frontier/discovery/discovery_watcher.hpp"
#include "frontier/discovery/zk_session.hpp"
#include "frontier/obs/observability.hpp"
#include "frontier/proxy/http_frontend.hpp"
#include "frontier/routing/backend_directory.hpp"
#include "frontier/routing/hash_ring.hpp"
#include "frontier/version.hpp"

int main(int argc, char* argv[]) {
    using namespace frontier;

    auto cfg = config::Loader::load_from_args(argc, argv);
    if (!cfg) {
        switch (cfg.error().kind) {
            case config::ConfigError::Kind::HelpRequested:
            case config::ConfigError::Kind::VersionRequested:
                std::printf("%s\n", cfg.error().message.c_str());
                return EXIT_SUCCESS;
            case config::ConfigError::Kind::Invalid:
                std::fprintf(stderr, "frontier_fe: %s (see --help)\n", cfg.error().message.c_str());
                return EXIT_FAILURE;
        }
    }

    obs::init_logging(cfg->log_level);
    spdlog::info("frontier_fe {} starting (zookeeper={}, environment={})",
                 version_string, cfg->coordination.hosts, cfg->coordination.environment);

    if (!routing::HashRing::digest_available()) {
        spdlog::critical("OpenSSL refuses MD5; backend ring positions cannot be computed");
        return EXIT_FAILURE;
    }

    obs::Observer* observer = obs::make_simple_observer();
    routing::BackendDirectory directory;

    auto factory = std::make_shared<discovery::ZooKeeperSessionFactory>(cfg->coordination);
    discovery::DiscoveryWatcher watcher(factory, directory, cfg->discovery, observer);

    if (auto r = watcher.initial_load(); !r) {
        spdlog::critical("Initial load from ZooKeeper failed: {}: {}",
                         discovery::to_string(r.error().code), r.error().detail);
        return EXIT_FAILURE;
    }
    watcher.start();

    boost::asio::io_context ioc(static_cast<int>(cfg->http.threads));
    proxy::HttpFrontend frontend(ioc, directory, cfg->http, observer);
    if (auto r = frontend.start(); !r) {
        spdlog::critical("Cannot listen on {}:{}: {}", cfg->http.bind_address, cfg->http.bind_port,
                         r.error().message());
        watcher.stop();
        return EXIT_FAILURE;
    }

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        spdlog::info("Signal {} received, shutting down", signo);
        frontend.stop();
        ioc.stop();
    });

    std::vector<std::thread> runners;
    runners.reserve(cfg->http.threads - 1);
    for (unsigned i = 1; i < cfg->http.threads; ++i) {
        runners.emplace_back([&ioc] { ioc.run(); });
    }
    ioc.run();
    for (auto& t : runners) t.join();

    watcher.stop();

    const auto c = observer->snapshot();
    spdlog::info("Stopped: requests={} routed={} not_found={} unavailable={} upstream_errors={} "
                 "bad_requests={} discovery_restarts={}",
                 c.requests, c.routed, c.not_found, c.unavailable, c.upstream_errors,
                 c.bad_requests, c.discovery_restarts);
    return EXIT_SUCCESS;
}
