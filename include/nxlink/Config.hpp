#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace nxlink {

// Upper bound accepted for the per-attempt discovery timeout.
inline constexpr std::chrono::milliseconds kMaxDiscoveryTimeout{std::chrono::hours(1)};

struct Config {
    std::string broadcast_address{"255.255.255.255"};
    std::uint16_t server_port{28280};
    std::uint16_t client_port{28771};
    std::chrono::milliseconds discovery_timeout{std::chrono::milliseconds(250)};
    std::uint32_t discovery_retries{10};
    std::size_t upload_chunk_size{0x4000};
    std::size_t stdio_buffer_size{1024};
    bool start_stdio_server{false};
    std::string log_level{"warning"};
};

}  // namespace nxlink
