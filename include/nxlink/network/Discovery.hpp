#pragma once

#include "nxlink/Config.hpp"
#include "nxlink/core/EventLoop.hpp"
#include "nxlink/protocol/Message.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace nxlink::network {

struct DiscoveryOptions {
    std::string broadcast_address{"255.255.255.255"};
    std::uint16_t probe_port{protocol::kServerPort};
    std::uint16_t reply_port{protocol::kClientPort};
    std::chrono::milliseconds timeout{std::chrono::milliseconds(250)};
    std::uint32_t max_attempts{10};

    static DiscoveryOptions from_config(const Config& config);
};

// Broadcasts the netloader probe and waits for a "bootnx" reply, once per
// attempt, each attempt bounded by options.timeout. Returns the responder's
// IPv4 address, or std::nullopt when every attempt went unanswered.
//
// Socket setup failures are thrown as std::system_error. Failures inside an
// attempt (send errors, invalid replies) only abort the current attempt,
// except on the final attempt where they are rethrown. Zero attempts returns
// immediately without binding any socket.
std::optional<std::string> discover(core::EventLoop& loop, const DiscoveryOptions& options);

std::optional<std::string> discover(core::EventLoop& loop,
                                    std::chrono::milliseconds timeout,
                                    std::uint32_t max_attempts);

}  // namespace nxlink::network
