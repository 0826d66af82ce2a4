#include "nxlink/protocol/Frame.hpp"

#include <limits>
#include <stdexcept>

namespace nxlink::protocol {

void append_u32_le(std::vector<std::uint8_t>& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>(value & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFFu));
}

void append_i32_le(std::vector<std::uint8_t>& out, std::int32_t value) {
    append_u32_le(out, static_cast<std::uint32_t>(value));
}

std::uint32_t read_u32_le(const std::uint8_t* data) noexcept {
    return static_cast<std::uint32_t>(data[0]) |
           (static_cast<std::uint32_t>(data[1]) << 8) |
           (static_cast<std::uint32_t>(data[2]) << 16) |
           (static_cast<std::uint32_t>(data[3]) << 24);
}

std::int32_t read_i32_le(const std::uint8_t* data) noexcept {
    return static_cast<std::int32_t>(read_u32_le(data));
}

std::vector<std::uint8_t> encode_frame(std::span<const std::uint8_t> payload) {
    if (payload.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw std::length_error("frame payload exceeds u32 length field");
    }
    std::vector<std::uint8_t> out;
    out.reserve(kLengthFieldSize + payload.size());
    append_u32_le(out, static_cast<std::uint32_t>(payload.size()));
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

std::optional<DecodedFrame> decode_frame(std::span<const std::uint8_t> buffer) noexcept {
    if (buffer.size() < kLengthFieldSize) {
        return std::nullopt;
    }
    const auto length = static_cast<std::size_t>(read_u32_le(buffer.data()));
    if (buffer.size() - kLengthFieldSize < length) {
        return std::nullopt;
    }
    DecodedFrame frame{};
    frame.payload = buffer.subspan(kLengthFieldSize, length);
    frame.consumed = kLengthFieldSize + length;
    return frame;
}

}  // namespace nxlink::protocol
