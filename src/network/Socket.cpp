#include "nxlink/network/Socket.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>
#include <utility>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace nxlink::network {

namespace {

using core::EventLoop;

[[noreturn]] void throw_socket_error(int code, const std::string& context) {
    throw std::system_error(code, std::generic_category(), context);
}

void configure_socket(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) {
        throw_socket_error(errno, "fcntl O_NONBLOCK failed");
    }
    int opts = ::fcntl(fd, F_GETFD, 0);
    if (opts >= 0) {
        ::fcntl(fd, F_SETFD, opts | FD_CLOEXEC);
    }
}

ScopedSocket open_socket(int type) {
    ScopedSocket socket{::socket(AF_INET, type, 0)};
    if (!socket) {
        throw_socket_error(errno, "socket failed");
    }
    configure_socket(socket.get());
    return socket;
}

sockaddr_in resolve(const Endpoint& endpoint) {
    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_port = htons(endpoint.port);
    if (endpoint.host.empty()) {
        address.sin_addr.s_addr = htonl(INADDR_ANY);
        return address;
    }
    if (::inet_pton(AF_INET, endpoint.host.c_str(), &address.sin_addr) == 1) {
        return address;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    addrinfo* result = nullptr;
    if (const auto err = ::getaddrinfo(endpoint.host.c_str(), nullptr, &hints, &result); err != 0 || result == nullptr) {
        if (result) {
            ::freeaddrinfo(result);
        }
        throw_socket_error(EHOSTUNREACH, "cannot resolve host " + endpoint.host);
    }
    address.sin_addr = reinterpret_cast<sockaddr_in*>(result->ai_addr)->sin_addr;
    ::freeaddrinfo(result);
    return address;
}

Endpoint to_endpoint(const sockaddr_in& address) {
    char buffer[INET_ADDRSTRLEN]{};
    Endpoint endpoint{};
    if (::inet_ntop(AF_INET, &address.sin_addr, buffer, sizeof(buffer))) {
        endpoint.host = buffer;
    }
    endpoint.port = ntohs(address.sin_port);
    return endpoint;
}

Endpoint local_endpoint_of(int fd) {
    sockaddr_in address{};
    socklen_t len = sizeof(address);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&address), &len) != 0) {
        throw_socket_error(errno, "getsockname failed");
    }
    return to_endpoint(address);
}

void bind_socket(int fd, const Endpoint& local) {
    const auto address = resolve(local);
    if (::bind(fd, reinterpret_cast<const sockaddr*>(&address), sizeof(address)) != 0) {
        throw_socket_error(errno, "bind " + describe_endpoint(local) + " failed");
    }
}

bool would_block(int code) {
    return code == EAGAIN || code == EWOULDBLOCK;
}

}  // namespace

std::string describe_endpoint(const Endpoint& endpoint) {
    return (endpoint.host.empty() ? std::string{"0.0.0.0"} : endpoint.host) + ":" + std::to_string(endpoint.port);
}

void ScopedSocket::reset(int handle) {
    if (handle_ >= 0) {
        ::shutdown(handle_, SHUT_RDWR);
        ::close(handle_);
    }
    handle_ = handle;
}

TcpStream::TcpStream(core::EventLoop& loop, ScopedSocket socket, Endpoint peer)
    : loop_(&loop), socket_(std::move(socket)), peer_(std::move(peer)) {}

TcpStream TcpStream::connect(core::EventLoop& loop, const Endpoint& remote) {
    loop.throw_if_cancelled();
    const auto address = resolve(remote);
    auto socket = open_socket(SOCK_STREAM);

    if (::connect(socket.get(), reinterpret_cast<const sockaddr*>(&address), sizeof(address)) != 0) {
        if (errno != EINPROGRESS) {
            throw_socket_error(errno, "connect " + describe_endpoint(remote) + " failed");
        }
        loop.wait(socket.get(), EventLoop::kEventWritable);

        int error = 0;
        socklen_t len = sizeof(error);
        if (::getsockopt(socket.get(), SOL_SOCKET, SO_ERROR, &error, &len) != 0) {
            throw_socket_error(errno, "getsockopt SO_ERROR failed");
        }
        if (error != 0) {
            throw_socket_error(error, "connect " + describe_endpoint(remote) + " failed");
        }
    }

    return TcpStream{loop, std::move(socket), remote};
}

void TcpStream::write_all(std::span<const std::uint8_t> data) {
    std::size_t total = 0;
    while (total < data.size()) {
        loop_->throw_if_cancelled();
        const auto sent = ::send(socket_.get(), data.data() + total, data.size() - total, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (would_block(errno)) {
                loop_->wait(socket_.get(), EventLoop::kEventWritable);
                continue;
            }
            throw_socket_error(errno, "send to " + describe_endpoint(peer_) + " failed");
        }
        total += static_cast<std::size_t>(sent);
    }
}

void TcpStream::read_exact(std::span<std::uint8_t> buffer) {
    std::size_t total = 0;
    while (total < buffer.size()) {
        const auto received = read_some(buffer.subspan(total));
        if (received == 0) {
            throw_socket_error(ECONNRESET, "connection closed by " + describe_endpoint(peer_));
        }
        total += received;
    }
}

std::size_t TcpStream::read_some(std::span<std::uint8_t> buffer) {
    while (true) {
        loop_->throw_if_cancelled();
        const auto received = ::recv(socket_.get(), buffer.data(), buffer.size(), 0);
        if (received >= 0) {
            return static_cast<std::size_t>(received);
        }
        if (errno == EINTR) {
            continue;
        }
        if (would_block(errno)) {
            loop_->wait(socket_.get(), EventLoop::kEventReadable);
            continue;
        }
        throw_socket_error(errno, "recv from " + describe_endpoint(peer_) + " failed");
    }
}

TcpListener::TcpListener(core::EventLoop& loop, ScopedSocket socket)
    : loop_(&loop), socket_(std::move(socket)) {}

TcpListener TcpListener::bind(core::EventLoop& loop, const Endpoint& local) {
    auto socket = open_socket(SOCK_STREAM);

    int enable = 1;
    ::setsockopt(socket.get(), SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));

    bind_socket(socket.get(), local);
    if (::listen(socket.get(), SOMAXCONN) != 0) {
        throw_socket_error(errno, "listen on " + describe_endpoint(local) + " failed");
    }
    return TcpListener{loop, std::move(socket)};
}

TcpStream TcpListener::accept() {
    while (true) {
        loop_->throw_if_cancelled();
        sockaddr_in remote{};
        socklen_t len = sizeof(remote);
        const int client_fd = ::accept(socket_.get(), reinterpret_cast<sockaddr*>(&remote), &len);
        if (client_fd >= 0) {
            ScopedSocket client{client_fd};
            configure_socket(client.get());
            return TcpStream{*loop_, std::move(client), to_endpoint(remote)};
        }
        if (errno == EINTR || errno == ECONNABORTED) {
            continue;
        }
        if (would_block(errno)) {
            loop_->wait(socket_.get(), EventLoop::kEventReadable);
            continue;
        }
        throw_socket_error(errno, "accept failed");
    }
}

Endpoint TcpListener::local_endpoint() const {
    return local_endpoint_of(socket_.get());
}

UdpSocket::UdpSocket(core::EventLoop& loop, ScopedSocket socket)
    : loop_(&loop), socket_(std::move(socket)) {}

UdpSocket UdpSocket::bind(core::EventLoop& loop, const Endpoint& local) {
    auto socket = open_socket(SOCK_DGRAM);
    bind_socket(socket.get(), local);
    return UdpSocket{loop, std::move(socket)};
}

void UdpSocket::set_broadcast(bool enabled) {
    int value = enabled ? 1 : 0;
    if (::setsockopt(socket_.get(), SOL_SOCKET, SO_BROADCAST, &value, sizeof(value)) != 0) {
        throw_socket_error(errno, "setsockopt SO_BROADCAST failed");
    }
}

void UdpSocket::send_to(std::span<const std::uint8_t> payload,
                        const Endpoint& target,
                        core::EventLoop::Deadline deadline) {
    const auto address = resolve(target);
    while (true) {
        loop_->throw_if_cancelled();
        const auto sent = ::sendto(socket_.get(), payload.data(), payload.size(), 0,
                                   reinterpret_cast<const sockaddr*>(&address), sizeof(address));
        if (sent >= 0) {
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (would_block(errno)) {
            if (loop_->wait(socket_.get(), EventLoop::kEventWritable, deadline) == EventLoop::kEventNone) {
                throw_socket_error(ETIMEDOUT, "sendto " + describe_endpoint(target) + " timed out");
            }
            continue;
        }
        throw_socket_error(errno, "sendto " + describe_endpoint(target) + " failed");
    }
}

std::optional<UdpSocket::Datagram> UdpSocket::receive_from(std::span<std::uint8_t> buffer,
                                                           core::EventLoop::Deadline deadline) {
    while (true) {
        loop_->throw_if_cancelled();
        sockaddr_in remote{};
        socklen_t len = sizeof(remote);
        const auto received = ::recvfrom(socket_.get(), buffer.data(), buffer.size(), 0,
                                         reinterpret_cast<sockaddr*>(&remote), &len);
        if (received >= 0) {
            Datagram datagram{};
            datagram.size = static_cast<std::size_t>(received);
            datagram.sender = to_endpoint(remote);
            return datagram;
        }
        if (errno == EINTR) {
            continue;
        }
        if (would_block(errno)) {
            if (loop_->wait(socket_.get(), EventLoop::kEventReadable, deadline) == EventLoop::kEventNone) {
                return std::nullopt;
            }
            continue;
        }
        throw_socket_error(errno, "recvfrom failed");
    }
}

}  // namespace nxlink::network
