#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the discovery and proxy components.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (command line) in production deployments.
 */

#include <cstddef>
#include <cstdint>

namespace frontier::config::constants {

// =====================
// Consistent-hash ring
// =====================
/// Virtual nodes inserted per backend.
inline constexpr std::size_t RING_REPLICAS = 20;

// =====================
// Coordination namespace layout (relative to the environment chroot)
// =====================
/// Root under which every function has a child node named by its UUID.
inline constexpr const char* FUNCTION_ROOT   = "/function";
/// Name of the data node holding a function's encoded backend list.
inline constexpr const char* BACKENDS_NODE   = "backends";

// =====================
// Coordination service defaults
// =====================
inline constexpr const char* ZK_DEFAULT_HOSTS        = "127.0.0.1:2181";
inline constexpr const char* ZK_DEFAULT_ENVIRONMENT  = "default";
inline constexpr uint32_t    ZK_SESSION_TIMEOUT_MS   = 10000; ///< Also bounds the initial connect wait
inline constexpr int         ZK_GET_DATA_ATTEMPTS    = 3;     ///< Re-reads when the node grows mid-fetch

// =====================
// Discovery watcher
// =====================
/// Fixed delay between a failed watch iteration and the next one.
inline constexpr uint32_t DISCOVERY_RESTART_DELAY_MS = 1000;

// =====================
// HTTP surface
// =====================
inline constexpr const char* HTTP_DEFAULT_BIND_ADDRESS = "0.0.0.0";
inline constexpr uint16_t    HTTP_DEFAULT_BIND_PORT    = 8000;
/// Port every backend instance listens on.
inline constexpr uint16_t    BACKEND_PORT              = 8080;
inline constexpr uint32_t    UPSTREAM_CONNECT_TIMEOUT_MS = 5000;
/// Chunk size used when relaying bodies between client and backend.
inline constexpr std::size_t RELAY_CHUNK_BYTES         = 16 * 1024;

inline constexpr const char* HEALTHZ_PATH = "/healthz";
inline constexpr const char* HEALTHZ_BODY = "OK";
inline constexpr const char* INVOKE_PREFIX = "/invoke/";

// =====================
// Logging
// =====================
inline constexpr const char* LOG_DEFAULT_LEVEL = "info";
inline constexpr const char* LOG_PATTERN       = "[%Y-%m-%dT%H:%M:%S.%e] [%^%l%$] [%t] %v";

} // namespace frontier::config::constants
