#include "nxlink/network/Discovery.hpp"

#include "nxlink/Error.hpp"
#include "nxlink/network/Socket.hpp"
#include "nxlink/util/StructuredLogger.hpp"

#include <array>
#include <span>
#include <string>
#include <system_error>

namespace nxlink::network {

namespace {

using util::StructuredLogger;

constexpr std::size_t kReplyBufferSize = 0x10;

std::string printable(std::span<const std::uint8_t> bytes) {
    std::string text;
    text.reserve(bytes.size());
    for (const auto byte : bytes) {
        text.push_back(byte >= 0x20 && byte < 0x7F ? static_cast<char>(byte) : '.');
    }
    return text;
}

}  // namespace

DiscoveryOptions DiscoveryOptions::from_config(const Config& config) {
    DiscoveryOptions options{};
    options.broadcast_address = config.broadcast_address;
    options.probe_port = config.server_port;
    options.reply_port = config.client_port;
    options.timeout = config.discovery_timeout;
    options.max_attempts = config.discovery_retries;
    return options;
}

std::optional<std::string> discover(core::EventLoop& loop, const DiscoveryOptions& options) {
    auto& logger = StructuredLogger::instance();
    if (options.max_attempts == 0) {
        logger.debug("discovery.skipped", {{"reason", "zero attempts"}});
        return std::nullopt;
    }

    auto broadcast_socket = UdpSocket::bind(loop, Endpoint{"0.0.0.0", 0});
    broadcast_socket.set_broadcast(true);
    auto receive_socket = UdpSocket::bind(loop, Endpoint{"0.0.0.0", options.reply_port});

    const Endpoint target{options.broadcast_address, options.probe_port};
    std::array<std::uint8_t, kReplyBufferSize> buffer{};

    for (std::uint32_t attempt = 0; attempt < options.max_attempts; ++attempt) {
        const bool final_attempt = attempt + 1 == options.max_attempts;
        const auto deadline = core::EventLoop::Clock::now() + options.timeout;

        logger.debug("discovery.probe_sent", {{"attempt", std::to_string(attempt)},
                                              {"target", describe_endpoint(target)}});
        try {
            broadcast_socket.send_to(protocol::kProbeMessage, target, deadline);
        } catch (const std::system_error& error) {
            if (error.code() == std::errc::timed_out) {
                continue;
            }
            logger.debug("discovery.send_failed", {{"attempt", std::to_string(attempt)},
                                                   {"error", error.what()}});
            if (final_attempt) {
                throw;
            }
            continue;
        }

        std::optional<UdpSocket::Datagram> reply;
        try {
            reply = receive_socket.receive_from(buffer, deadline);
        } catch (const std::system_error& error) {
            logger.debug("discovery.receive_failed", {{"attempt", std::to_string(attempt)},
                                                      {"error", error.what()}});
            if (final_attempt) {
                throw;
            }
            continue;
        }

        if (!reply) {
            logger.debug("discovery.timeout", {{"attempt", std::to_string(attempt)}});
            continue;
        }

        const auto payload = std::span<const std::uint8_t>(buffer.data(), reply->size);
        if (protocol::is_probe_reply(payload)) {
            logger.log(StructuredLogger::Level::Info, "discovery.server_found",
                       {{"address", reply->sender.host}, {"attempt", std::to_string(attempt)}});
            return reply->sender.host;
        }

        logger.debug("discovery.invalid_reply", {{"attempt", std::to_string(attempt)},
                                                 {"sender", describe_endpoint(reply->sender)},
                                                 {"payload", printable(payload)}});
        if (final_attempt) {
            throw ProtocolError("invalid response message from " + reply->sender.host);
        }
    }

    return std::nullopt;
}

std::optional<std::string> discover(core::EventLoop& loop,
                                    std::chrono::milliseconds timeout,
                                    std::uint32_t max_attempts) {
    DiscoveryOptions options{};
    options.timeout = timeout;
    options.max_attempts = max_attempts;
    return discover(loop, options);
}

}  // namespace nxlink::network
