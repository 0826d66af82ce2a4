#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace nxlink::protocol {

// netloader server: TCP uploads and UDP discovery probes.
inline constexpr std::uint16_t kServerPort = 28280;
// Client side: UDP discovery replies and the TCP stdio listener.
inline constexpr std::uint16_t kClientPort = 28771;

inline constexpr std::array<std::uint8_t, 6> kProbeMessage{'n', 'x', 'b', 'o', 'o', 't'};
inline constexpr std::array<std::uint8_t, 6> kProbeReply{'b', 'o', 'o', 't', 'n', 'x'};

// Uncompressed bytes read per iteration, and the largest compressed frame the
// server accepts.
inline constexpr std::size_t kMaxChunkSize = 0x4000;
inline constexpr std::size_t kMaxArgumentBytes = 3072;
inline constexpr std::size_t kStdioBufferSize = 1024;

bool is_probe_reply(std::span<const std::uint8_t> datagram) noexcept;

struct CreateFileFailed {};
struct InsufficientSpace {};
struct UnrecognizedExtension {};
struct UnknownPeerError {
    std::int32_t code{0};
};

using PeerError = std::variant<CreateFileFailed,
                               InsufficientSpace,
                               UnrecognizedExtension,
                               UnknownPeerError>;

// std::nullopt for 0 (success).
std::optional<PeerError> classify_acknowledgement(std::int32_t code) noexcept;
std::string describe_peer_error(const PeerError& error);

// Concatenates null-terminated arguments up to kMaxArgumentBytes. Stops at
// the first argument that does not fit; no argument is ever truncated.
std::vector<std::uint8_t> build_argument_blob(const std::vector<std::string>& arguments,
                                              std::size_t capacity = kMaxArgumentBytes);

}  // namespace nxlink::protocol
