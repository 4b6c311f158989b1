/**
 * @file backend.cpp
 * @brief Identifier parsing and textual forms for the backend model.
 */
#include "frontier/routing/backend.hpp"

#include <cstddef>

#include <boost/uuid/uuid_io.hpp>

namespace frontier::routing {

namespace {

constexpr std::size_t kUuidTextLen = 36;

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_dash_position(std::size_t i) noexcept {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

} // namespace

std::optional<FunctionId> parse_function_id(std::string_view text) noexcept {
    if (text.size() != kUuidTextLen) return std::nullopt;

    FunctionId id{};
    std::size_t out = 0;
    int high = -1;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (is_dash_position(i)) {
            if (c != '-') return std::nullopt;
            continue;
        }
        const int v = hex_value(c);
        if (v < 0) return std::nullopt;
        if (high < 0) {
            high = v;
        } else {
            id.data[out++] = static_cast<std::uint8_t>((high << 4) | v);
            high = -1;
        }
    }
    return id;
}

std::string to_string(const boost::uuids::uuid& id) {
    return boost::uuids::to_string(id);
}

std::string to_string(const Backend& b) {
    std::string s = b.ip.to_string();
    s.push_back('-');
    s += boost::uuids::to_string(b.instance_id);
    return s;
}

} // namespace frontier::routing
