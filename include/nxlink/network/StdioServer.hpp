#pragma once

#include "nxlink/core/EventLoop.hpp"
#include "nxlink/network/Socket.hpp"
#include "nxlink/protocol/Message.hpp"

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <ostream>

namespace nxlink::network {

// Receives the console stream of an app started by the netloader server and
// copies it verbatim to a local sink. Accepts exactly one connection.
class StdioServer {
public:
    explicit StdioServer(core::EventLoop& loop,
                         std::ostream& sink = std::cout,
                         std::size_t buffer_size = protocol::kStdioBufferSize);

    StdioServer(const StdioServer&) = delete;
    StdioServer& operator=(const StdioServer&) = delete;

    // Returns the bound endpoint (useful when binding port 0).
    Endpoint bind(const Endpoint& local);

    // Accepts one connection and relays it until the peer closes. Returns
    // normally on orderly close; read and write failures are thrown.
    void run();

    std::uint64_t bytes_relayed() const noexcept { return bytes_relayed_; }

private:
    void relay(TcpStream& stream);

    core::EventLoop& loop_;
    std::ostream& sink_;
    std::size_t buffer_size_;
    std::optional<TcpListener> listener_;
    std::uint64_t bytes_relayed_{0};
};

void serve_stdio(core::EventLoop& loop, const Endpoint& bind_address, std::ostream& sink = std::cout);

}  // namespace nxlink::network
