#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults, overridden from the command line.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <cstddef>
#include <cstdint>
#include <string>

#include "frontier/compat/expected.hpp"

namespace frontier::config {

    /** @struct CoordinationConfig
     *  @brief Where the coordination service lives and how sessions behave.
     */
    struct CoordinationConfig {
        std::string hosts;               ///< ZooKeeper host list, "h1:p1,h2:p2"
        std::string environment;         ///< Environment name, used as the chroot
        uint32_t    session_timeout_ms{0};
    };

    /** @struct DiscoveryConfig
     *  @brief Discovery watcher tuning.
     */
    struct DiscoveryConfig {
        std::string function_root;       ///< Namespace root holding one node per function
        std::size_t replicas{0};         ///< Virtual nodes per backend
        uint32_t    restart_delay_ms{0}; ///< Fixed backoff between watch iterations
    };

    /** @struct HttpConfig
     *  @brief Front-end listener and upstream settings.
     */
    struct HttpConfig {
        std::string bind_address;        ///< IPv4 literal
        uint16_t    bind_port{0};        ///< 0 picks an ephemeral port
        uint16_t    backend_port{0};     ///< Port every backend listens on
        unsigned    threads{1};          ///< io_context worker threads
        uint32_t    connect_timeout_ms{0};
    };

    /** @struct FrontendConfig
     *  @brief Aggregate of sub-configs required by the front end.
     */
    struct FrontendConfig {
        CoordinationConfig coordination; ///< ZooKeeper ensemble + environment
        DiscoveryConfig    discovery;    ///< Ring and watcher settings
        HttpConfig         http;         ///< Listener + backend port
        std::string        log_level;    ///< spdlog level name
    };

    /** @struct ConfigError
     *  @brief Why load_from_args() did not produce a configuration.
     */
    struct ConfigError {
        enum class Kind : uint8_t { HelpRequested, VersionRequested, Invalid };
        Kind        kind{Kind::Invalid};
        std::string message;             ///< Usage text for HelpRequested, diagnostic otherwise
    };

    /** @class Loader
     *  @brief Source of front-end configuration (defaults or command line).
     */
    class Loader {
    public:
        /// Configuration built purely from named constants.
        static FrontendConfig defaults();

        /**
         * @brief Parse command-line options over the defaults.
         * @return FrontendConfig, or ConfigError for --help/--version/invalid input.
         */
        static frontier_detail::expected<FrontendConfig, ConfigError>
        load_from_args(int argc, const char* const argv[]);
    };

} // namespace frontier::config
