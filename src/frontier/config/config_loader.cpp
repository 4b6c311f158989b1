/**
* @file config_loader.cpp
 * @brief Defaults from named constants; command-line overrides via Boost.ProgramOptions.
 */
#include "frontier/config/config_loader.hpp"
#include "frontier/config/constants.hpp"
#include "frontier/version.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <sstream>
#include <string_view>
#include <thread>

#include <boost/asio/ip/address_v4.hpp>
#include <boost/program_options.hpp>

namespace frontier::config {
    using namespace frontier::config::constants;
    namespace po = boost::program_options;

    namespace {

    frontier_detail::unexpected<ConfigError> invalid(std::string msg) {
        return frontier_detail::unexpected(ConfigError{ConfigError::Kind::Invalid, std::move(msg)});
    }

    bool parse_port(std::string_view text, uint16_t& out) {
        unsigned v = 0;
        auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
        if (ec != std::errc{} || p != text.data() + text.size() || v > 65535) return false;
        out = static_cast<uint16_t>(v);
        return true;
    }

    /// "a.b.c.d:port" → (address, port)
    bool parse_bind(const std::string& text, HttpConfig& http) {
        const auto colon = text.rfind(':');
        if (colon == std::string::npos) return false;
        boost::system::error_code ec;
        boost::asio::ip::make_address_v4(text.substr(0, colon), ec);
        if (ec) return false;
        uint16_t port = 0;
        if (!parse_port(std::string_view(text).substr(colon + 1), port)) return false;
        http.bind_address = text.substr(0, colon);
        http.bind_port = port;
        return true;
    }

    bool known_log_level(std::string_view level) {
        constexpr std::array<std::string_view, 7> levels{
            "trace", "debug", "info", "warn", "error", "critical", "off"};
        for (auto l : levels) if (l == level) return true;
        return false;
    }

    } // namespace

    FrontendConfig Loader::defaults() {
        FrontendConfig fc;
        fc.coordination.hosts              = ZK_DEFAULT_HOSTS;
        fc.coordination.environment        = ZK_DEFAULT_ENVIRONMENT;
        fc.coordination.session_timeout_ms = ZK_SESSION_TIMEOUT_MS;

        fc.discovery.function_root    = FUNCTION_ROOT;
        fc.discovery.replicas         = RING_REPLICAS;
        fc.discovery.restart_delay_ms = DISCOVERY_RESTART_DELAY_MS;

        fc.http.bind_address       = HTTP_DEFAULT_BIND_ADDRESS;
        fc.http.bind_port          = HTTP_DEFAULT_BIND_PORT;
        fc.http.backend_port       = BACKEND_PORT;
        fc.http.threads            = std::max(1u, std::thread::hardware_concurrency());
        fc.http.connect_timeout_ms = UPSTREAM_CONNECT_TIMEOUT_MS;

        fc.log_level = LOG_DEFAULT_LEVEL;
        return fc;
    }

    frontier_detail::expected<FrontendConfig, ConfigError>
    Loader::load_from_args(int argc, const char* const argv[]) {
        FrontendConfig fc = defaults();

        std::string bind = fc.http.bind_address + ":" + std::to_string(fc.http.bind_port);
        unsigned backend_port = fc.http.backend_port;

        po::options_description general("General options");
        general.add_options()
            ("help,h", "show this message")
            ("version,v", "show version information")
            ("log-level", po::value<std::string>(&fc.log_level)->default_value(fc.log_level),
                "trace, debug, info, warn, error, critical or off");

        po::options_description coordination("Coordination options");
        coordination.add_options()
            ("zookeeper", po::value<std::string>(&fc.coordination.hosts)->default_value(fc.coordination.hosts),
                "ZooKeeper host:port list")
            ("zookeeper-env", po::value<std::string>(&fc.coordination.environment)
                ->default_value(fc.coordination.environment),
                "ZooKeeper environment name (e.g. \"dev\", \"test\", \"default\")")
            ("session-timeout-ms", po::value<uint32_t>(&fc.coordination.session_timeout_ms)
                ->default_value(fc.coordination.session_timeout_ms),
                "ZooKeeper session timeout, milliseconds");

        po::options_description http("HTTP options");
        http.add_options()
            ("bind", po::value<std::string>(&bind)->default_value(bind), "bind IPv4:port")
            ("backend-port", po::value<unsigned>(&backend_port)->default_value(backend_port),
                "port backend instances listen on")
            ("threads", po::value<unsigned>(&fc.http.threads)->default_value(fc.http.threads),
                "proxy I/O threads");

        po::options_description all;
        all.add(general).add(coordination).add(http);

        po::variables_map vm;
        try {
            po::store(po::parse_command_line(argc, argv, all), vm);
            po::notify(vm);
        } catch (const po::error& e) {
            return invalid(e.what());
        }

        if (vm.count("help")) {
            std::ostringstream usage;
            usage << "Usage: frontier_fe [options]\n" << all;
            return frontier_detail::unexpected(ConfigError{ConfigError::Kind::HelpRequested, usage.str()});
        }
        if (vm.count("version")) {
            return frontier_detail::unexpected(
                ConfigError{ConfigError::Kind::VersionRequested, version_string});
        }

        if (!parse_bind(bind, fc.http))                 return invalid("invalid --bind address: " + bind);
        if (backend_port == 0 || backend_port > 65535)  return invalid("invalid --backend-port");
        fc.http.backend_port = static_cast<uint16_t>(backend_port);
        if (fc.http.threads == 0)                       return invalid("--threads must be positive");
        if (fc.coordination.hosts.empty())              return invalid("--zookeeper must not be empty");
        if (!known_log_level(fc.log_level))             return invalid("unknown --log-level: " + fc.log_level);
        // Environment validity is checked when the session scopes to it.
        return fc;
    }

} // namespace frontier::config
