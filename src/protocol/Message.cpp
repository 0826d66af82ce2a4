#include "nxlink/protocol/Message.hpp"

#include <algorithm>
#include <type_traits>

namespace nxlink::protocol {

bool is_probe_reply(std::span<const std::uint8_t> datagram) noexcept {
    if (datagram.size() < kProbeMessage.size()) {
        return false;
    }
    return std::equal(kProbeReply.begin(), kProbeReply.end(), datagram.begin());
}

std::optional<PeerError> classify_acknowledgement(std::int32_t code) noexcept {
    switch (code) {
        case 0:
            return std::nullopt;
        case -1:
            return CreateFileFailed{};
        case -2:
            return InsufficientSpace{};
        case -3:
            return UnrecognizedExtension{};
        default:
            return UnknownPeerError{code};
    }
}

std::string describe_peer_error(const PeerError& error) {
    return std::visit([](const auto& value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, CreateFileFailed>) {
            return "Failed to create file";
        } else if constexpr (std::is_same_v<T, InsufficientSpace>) {
            return "Insufficient space";
        } else if constexpr (std::is_same_v<T, UnrecognizedExtension>) {
            return "File-extension not recognized";
        } else {
            return "Unknown error: " + std::to_string(value.code);
        }
    }, error);
}

std::vector<std::uint8_t> build_argument_blob(const std::vector<std::string>& arguments,
                                              std::size_t capacity) {
    std::vector<std::uint8_t> blob;
    blob.reserve(std::min<std::size_t>(capacity, 256));
    for (const auto& argument : arguments) {
        if (blob.size() + argument.size() + 1 > capacity) {
            break;
        }
        blob.insert(blob.end(), argument.begin(), argument.end());
        blob.push_back(0);
    }
    return blob;
}

}  // namespace nxlink::protocol
