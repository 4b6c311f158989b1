#pragma once
/**
 * @file trace_context.hpp
 * @brief W3C Trace Context ("traceparent" / "tracestate") propagation.
 *
 * traceparent = "00-" 32HEXDIG "-" 16HEXDIG "-" 2HEXDIG
 * All-zero trace or span ids are invalid. Version ff is invalid.
 */

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace frontier::proxy {

inline constexpr const char* TRACEPARENT_HEADER = "traceparent";
inline constexpr const char* TRACESTATE_HEADER  = "tracestate";

struct TraceContext {
    std::array<std::uint8_t, 16> trace_id{};
    std::array<std::uint8_t, 8>  span_id{};
    std::uint8_t                 flags{0};
    std::string                  tracestate;  ///< Passed through verbatim

    /// Parse a traceparent header value; nullopt when malformed or all-zero.
    static std::optional<TraceContext> parse(std::string_view traceparent);

    /// New trace with random ids, sampled.
    static TraceContext root();

    /// Same trace, fresh span id, same flags and tracestate.
    [[nodiscard]] TraceContext child() const;

    /// Version 00 header value.
    [[nodiscard]] std::string to_traceparent() const;

    [[nodiscard]] std::string trace_id_hex() const;
    [[nodiscard]] std::string span_id_hex() const;

    [[nodiscard]] bool valid() const noexcept;

    bool operator==(const TraceContext&) const = default;
};

/// Child of the inbound context, or a new root when there is none / it is invalid.
TraceContext continue_trace(std::string_view traceparent, std::string_view tracestate);

} // namespace frontier::proxy
