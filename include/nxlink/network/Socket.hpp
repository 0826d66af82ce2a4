#pragma once

#include "nxlink/core/EventLoop.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace nxlink::network {

struct Endpoint {
    std::string host;
    std::uint16_t port{0};
};

std::string describe_endpoint(const Endpoint& endpoint);

class ScopedSocket {
public:
    ScopedSocket() = default;
    explicit ScopedSocket(int handle) : handle_(handle) {}
    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;
    ScopedSocket(ScopedSocket&& other) noexcept : handle_(other.handle_) {
        other.handle_ = -1;
    }
    ScopedSocket& operator=(ScopedSocket&& other) noexcept {
        if (this != &other) {
            reset();
            handle_ = other.handle_;
            other.handle_ = -1;
        }
        return *this;
    }
    ~ScopedSocket() { reset(); }

    int get() const { return handle_; }
    bool valid() const { return handle_ >= 0; }
    explicit operator bool() const { return valid(); }

    void reset(int handle = -1);

private:
    int handle_{-1};
};

// Connected TCP stream. Every call that would block suspends on the loop.
class TcpStream {
public:
    TcpStream(core::EventLoop& loop, ScopedSocket socket, Endpoint peer);

    static TcpStream connect(core::EventLoop& loop, const Endpoint& remote);

    void write_all(std::span<const std::uint8_t> data);
    // Throws if the peer closes before the buffer is full.
    void read_exact(std::span<std::uint8_t> buffer);
    // Returns 0 once the peer has closed the connection.
    std::size_t read_some(std::span<std::uint8_t> buffer);

    const Endpoint& peer() const { return peer_; }
    int native_handle() const { return socket_.get(); }

private:
    core::EventLoop* loop_;
    ScopedSocket socket_;
    Endpoint peer_;
};

class TcpListener {
public:
    static TcpListener bind(core::EventLoop& loop, const Endpoint& local);

    TcpStream accept();

    Endpoint local_endpoint() const;

private:
    TcpListener(core::EventLoop& loop, ScopedSocket socket);

    core::EventLoop* loop_;
    ScopedSocket socket_;
};

class UdpSocket {
public:
    struct Datagram {
        std::size_t size{0};
        Endpoint sender;
    };

    static UdpSocket bind(core::EventLoop& loop, const Endpoint& local);

    void set_broadcast(bool enabled);
    void send_to(std::span<const std::uint8_t> payload,
                 const Endpoint& target,
                 core::EventLoop::Deadline deadline = std::nullopt);
    // std::nullopt when the deadline elapses before a datagram arrives.
    std::optional<Datagram> receive_from(std::span<std::uint8_t> buffer,
                                         core::EventLoop::Deadline deadline = std::nullopt);

private:
    UdpSocket(core::EventLoop& loop, ScopedSocket socket);

    core::EventLoop* loop_;
    ScopedSocket socket_;
};

}  // namespace nxlink::network
