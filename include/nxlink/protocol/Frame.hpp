#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace nxlink::protocol {

inline constexpr std::size_t kLengthFieldSize = sizeof(std::uint32_t);

void append_u32_le(std::vector<std::uint8_t>& out, std::uint32_t value);
void append_i32_le(std::vector<std::uint8_t>& out, std::int32_t value);

std::uint32_t read_u32_le(const std::uint8_t* data) noexcept;
std::int32_t read_i32_le(const std::uint8_t* data) noexcept;

// u32le length followed by the payload bytes.
std::vector<std::uint8_t> encode_frame(std::span<const std::uint8_t> payload);

struct DecodedFrame {
    std::span<const std::uint8_t> payload;
    std::size_t consumed{0};
};

// Splits one frame off the front of buffer; std::nullopt if it is incomplete.
std::optional<DecodedFrame> decode_frame(std::span<const std::uint8_t> buffer) noexcept;

}  // namespace nxlink::protocol
