/**
 * @file backend_codec.cpp
 * @brief Fixed-record encoder/decoder for backend lists.
 */
#include "frontier/codec/backend_codec.hpp"

#include <algorithm>

namespace frontier::codec {

const char* to_string(CodecError e) noexcept {
    switch (e) {
        case CodecError::Truncated: return "truncated backend record";
    }
    return "unknown codec error";
}

std::vector<std::uint8_t> encode_backends(std::span<const routing::Backend> backends) {
    std::vector<std::uint8_t> out;
    out.reserve(backends.size() * kBackendRecordSize);
    for (const auto& b : backends) {
        const auto ip = b.ip.to_bytes(); // network order
        out.insert(out.end(), ip.begin(), ip.end());
        out.insert(out.end(), b.instance_id.begin(), b.instance_id.end());
    }
    return out;
}

frontier_detail::expected<routing::BackendList, CodecError>
decode_backends(std::span<const std::uint8_t> payload) {
    if (payload.size() % kBackendRecordSize != 0) {
        return frontier_detail::unexpected(CodecError::Truncated);
    }

    routing::BackendList out;
    out.reserve(payload.size() / kBackendRecordSize);
    for (std::size_t off = 0; off < payload.size(); off += kBackendRecordSize) {
        const auto rec = payload.subspan(off, kBackendRecordSize);

        boost::asio::ip::address_v4::bytes_type ip{};
        std::copy_n(rec.begin(), ip.size(), ip.begin());

        routing::Backend b;
        b.ip = boost::asio::ip::address_v4(ip);
        std::copy_n(rec.begin() + 4, b.instance_id.size(), b.instance_id.begin());
        out.push_back(b);
    }
    return out;
}

} // namespace frontier::codec
