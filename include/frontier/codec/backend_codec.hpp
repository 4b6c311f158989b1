#pragma once
/**
 * @file backend_codec.hpp
 * @brief Byte encoding of the backend list stored at a function's backends node.
 *
 * Layout: a flat sequence of fixed-size records, no header.
 *
 *   offset  size  field
 *   0       4     IPv4 address, network byte order
 *   4       16    instance id, raw UUID bytes
 *
 * An empty payload is a valid, empty list.
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "frontier/compat/expected.hpp"
#include "frontier/routing/backend.hpp"

namespace frontier::codec {

/// Size of one encoded backend record.
inline constexpr std::size_t kBackendRecordSize = 4 + 16;

/// Decoding failures.
enum class CodecError : std::uint8_t {
    Truncated = 1   ///< Payload length is not a whole number of records
};

/// Human-readable name of a codec error.
const char* to_string(CodecError e) noexcept;

/// Serialize a backend list (order preserved).
[[nodiscard]] std::vector<std::uint8_t> encode_backends(std::span<const routing::Backend> backends);

/// Parse a payload produced by encode_backends().
[[nodiscard]] frontier_detail::expected<routing::BackendList, CodecError>
decode_backends(std::span<const std::uint8_t> payload);

} // namespace frontier::codec
