#include "nxlink/network/StdioServer.hpp"

#include "nxlink/util/StructuredLogger.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace nxlink::network {

using util::StructuredLogger;

StdioServer::StdioServer(core::EventLoop& loop, std::ostream& sink, std::size_t buffer_size)
    : loop_(loop),
      sink_(sink),
      buffer_size_(buffer_size == 0 ? protocol::kStdioBufferSize : buffer_size) {}

Endpoint StdioServer::bind(const Endpoint& local) {
    listener_.emplace(TcpListener::bind(loop_, local));
    const auto bound = listener_->local_endpoint();
    StructuredLogger::instance().debug("stdio.listening", {{"endpoint", describe_endpoint(bound)}});
    return bound;
}

void StdioServer::run() {
    if (!listener_) {
        throw std::logic_error("StdioServer::run called before bind");
    }
    auto stream = listener_->accept();
    // No further connections are taken.
    listener_.reset();

    auto& logger = StructuredLogger::instance();
    logger.debug("stdio.connection_accepted", {{"peer", describe_endpoint(stream.peer())}});
    relay(stream);
    logger.debug("stdio.connection_closed", {{"bytes", std::to_string(bytes_relayed_)}});
}

void StdioServer::relay(TcpStream& stream) {
    std::vector<std::uint8_t> buffer(buffer_size_);
    while (true) {
        const auto received = stream.read_some(buffer);
        if (received == 0) {
            return;
        }
        sink_.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(received));
        sink_.flush();
        if (!sink_) {
            throw std::system_error(EIO, std::generic_category(), "writing relayed output failed");
        }
        bytes_relayed_ += received;
    }
}

void serve_stdio(core::EventLoop& loop, const Endpoint& bind_address, std::ostream& sink) {
    StdioServer server{loop, sink};
    server.bind(bind_address);
    server.run();
}

}  // namespace nxlink::network
