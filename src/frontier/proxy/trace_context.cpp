/**
 * @file trace_context.cpp
 */
#include "frontier/proxy/trace_context.hpp"

#include <algorithm>
#include <random>

namespace frontier::proxy {

namespace {

constexpr char kHex[] = "0123456789abcdef";

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;  // upper case is not allowed by the header grammar
}

template <std::size_t N>
bool decode_hex(std::string_view text, std::array<std::uint8_t, N>& out) noexcept {
    if (text.size() != N * 2) return false;
    for (std::size_t i = 0; i < N; ++i) {
        const int hi = hex_value(text[2 * i]);
        const int lo = hex_value(text[2 * i + 1]);
        if (hi < 0 || lo < 0) return false;
        out[i] = static_cast<std::uint8_t>(hi << 4 | lo);
    }
    return true;
}

template <std::size_t N>
std::string encode_hex(const std::array<std::uint8_t, N>& in) {
    std::string s;
    s.reserve(N * 2);
    for (auto b : in) {
        s.push_back(kHex[b >> 4]);
        s.push_back(kHex[b & 0x0f]);
    }
    return s;
}

template <std::size_t N>
bool all_zero(const std::array<std::uint8_t, N>& a) noexcept {
    return std::all_of(a.begin(), a.end(), [](std::uint8_t b) { return b == 0; });
}

template <std::size_t N>
void fill_random(std::array<std::uint8_t, N>& out) {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    do {
        for (std::size_t i = 0; i < N; i += 8) {
            std::uint64_t v = rng();
            for (std::size_t j = 0; j < 8 && i + j < N; ++j) {
                out[i + j] = static_cast<std::uint8_t>(v >> (8 * j));
            }
        }
    } while (all_zero(out));
}

} // namespace

std::optional<TraceContext> TraceContext::parse(std::string_view h) {
    // 2 + 1 + 32 + 1 + 16 + 1 + 2; later versions may append fields after another '-'.
    constexpr std::size_t kLen = 55;
    if (h.size() < kLen) return std::nullopt;
    if (h[2] != '-' || h[35] != '-' || h[52] != '-') return std::nullopt;

    std::array<std::uint8_t, 1> version{};
    if (!decode_hex(h.substr(0, 2), version) || version[0] == 0xff) return std::nullopt;
    if (version[0] == 0 && h.size() != kLen) return std::nullopt;
    if (h.size() > kLen && h[kLen] != '-') return std::nullopt;

    TraceContext ctx;
    std::array<std::uint8_t, 1> flags{};
    if (!decode_hex(h.substr(3, 32), ctx.trace_id)) return std::nullopt;
    if (!decode_hex(h.substr(36, 16), ctx.span_id)) return std::nullopt;
    if (!decode_hex(h.substr(53, 2), flags)) return std::nullopt;
    ctx.flags = flags[0];

    if (!ctx.valid()) return std::nullopt;
    return ctx;
}

TraceContext TraceContext::root() {
    TraceContext ctx;
    fill_random(ctx.trace_id);
    fill_random(ctx.span_id);
    ctx.flags = 0x01;
    return ctx;
}

TraceContext TraceContext::child() const {
    TraceContext next = *this;
    do {
        fill_random(next.span_id);
    } while (next.span_id == span_id);
    return next;
}

std::string TraceContext::to_traceparent() const {
    std::string s = "00-";
    s += trace_id_hex();
    s += '-';
    s += span_id_hex();
    s += '-';
    s.push_back(kHex[flags >> 4]);
    s.push_back(kHex[flags & 0x0f]);
    return s;
}

std::string TraceContext::trace_id_hex() const { return encode_hex(trace_id); }
std::string TraceContext::span_id_hex() const { return encode_hex(span_id); }

bool TraceContext::valid() const noexcept {
    return !all_zero(trace_id) && !all_zero(span_id);
}

TraceContext continue_trace(std::string_view traceparent, std::string_view tracestate) {
    if (auto parent = TraceContext::parse(traceparent)) {
        parent->tracestate = std::string(tracestate);
        return parent->child();
    }
    return TraceContext::root();
}

} // namespace frontier::proxy
