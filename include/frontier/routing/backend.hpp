/**
 * @file backend.hpp
 * @brief Common backend model shared across routing, discovery and proxy components.
 *
 * Defines the function/instance identifiers and the `Backend` descriptor used by
 * the hash ring, the backend directory and the wire codec. Centralizing this
 * type keeps comparisons and textual forms consistent across modules.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include <boost/asio/ip/address_v4.hpp>
#include <boost/uuid/uuid.hpp>

namespace frontier::routing {

/// Identifier of a deployed function (key of the backend directory).
using FunctionId = boost::uuids::uuid;

/// Identifier of one running backend instance of a function.
using InstanceId = boost::uuids::uuid;

/**
 * @brief One running instance of a function.
 *
 * Immutable value type. Two backends at the same address with different
 * instance ids are different backends.
 */
struct Backend final {
  /// Address the instance is reachable at.
  boost::asio::ip::address_v4 ip;

  /// Instance identifier (also the first path segment on the backend).
  InstanceId instance_id{};

  /// Structural equality (compares all fields).
  bool operator==(const Backend&) const = default;

  /// Strict weak order: address first, then instance id.
  bool operator<(const Backend& o) const noexcept {
    return std::tie(ip, instance_id) < std::tie(o.ip, o.instance_id);
  }
};

/**
 * @brief Convenience alias for a list of backends.
 */
using BackendList = std::vector<Backend>;

/**
 * @brief Parse the canonical 36-character textual form of a UUID.
 * @return std::nullopt for anything else (braces, missing dashes, bad digits).
 */
[[nodiscard]] std::optional<FunctionId> parse_function_id(std::string_view text) noexcept;

/// Canonical lowercase textual form of an id.
[[nodiscard]] std::string to_string(const boost::uuids::uuid& id);

/// Stable identity string of a backend, "<ip>-<instance>" (ring hashing input).
[[nodiscard]] std::string to_string(const Backend& b);

} // namespace frontier::routing
