#include "nxlink/core/LinkRunner.hpp"

#include "nxlink/Error.hpp"
#include "nxlink/core/EventLoop.hpp"
#include "nxlink/network/Discovery.hpp"
#include "nxlink/network/FileSender.hpp"
#include "nxlink/network/StdioServer.hpp"
#include "nxlink/util/StructuredLogger.hpp"

#include <fstream>

namespace nxlink::core {

using util::StructuredLogger;

LinkRunner::LinkRunner(const Config& config,
                       const CancellationToken& token,
                       std::ostream& console,
                       std::ostream& stdio_sink)
    : config_(config),
      token_(token),
      console_(console),
      stdio_sink_(stdio_sink) {}

LinkOutcome LinkRunner::run(const LinkRequest& request) {
    auto& logger = StructuredLogger::instance();
    phase_ = Phase::Preparing;

    validate_nro_file(request.file);
    LinkOutcome outcome{};
    outcome.destination = resolve_destination_path(request.file, request.upload_path);
    const auto arguments = collect_arguments(request);

    std::ifstream file(request.file, std::ios::binary);
    if (!file) {
        throw Error("E_FILE_READ", "Failed to read the file: " + request.file.string());
    }
    std::error_code ec;
    outcome.file_length = std::filesystem::file_size(request.file, ec);
    if (ec) {
        throw Error("E_FILE_READ", "Failed to get the file size: " + ec.message());
    }
    logger.debug("link.prepared", {{"file", request.file.string()},
                                   {"destination", outcome.destination},
                                   {"length", std::to_string(outcome.file_length)},
                                   {"arguments", std::to_string(arguments.size())}});

    EventLoop loop{&token_};
    outcome.server_address = resolve_server(loop, request);
    console_ << "Sending file to: " << outcome.server_address << std::endl;

    phase_ = Phase::Upload;
    network::TransferSession session{};
    session.destination = network::Endpoint{outcome.server_address, config_.server_port};
    session.file_name = outcome.destination;
    session.reader = &file;
    session.file_length = outcome.file_length;
    session.arguments = arguments;
    network::send_file(loop, session);
    console_ << "File sent successfully" << std::endl;

    if (request.start_server.value_or(config_.start_stdio_server)) {
        phase_ = Phase::Stdio;
        console_ << "Starting the nxlink stdio server. Press Ctrl+C to exit." << std::endl;
        network::StdioServer server{loop, stdio_sink_, config_.stdio_buffer_size};
        server.bind(network::Endpoint{"0.0.0.0", config_.client_port});
        outcome.stdio_served = true;
        try {
            server.run();
        } catch (const OperationCancelled&) {
            // Ctrl+C is the normal way to leave the console relay.
            outcome.stdio_interrupted = true;
            logger.debug("stdio.interrupted", {{"bytes", std::to_string(server.bytes_relayed())}});
        }
    }

    phase_ = Phase::Finished;
    return outcome;
}

std::string LinkRunner::resolve_server(EventLoop& loop, const LinkRequest& request) {
    if (request.address) {
        return *request.address;
    }

    phase_ = Phase::Discovery;
    auto options = network::DiscoveryOptions::from_config(config_);
    if (request.retries) {
        options.max_attempts = *request.retries;
    }
    const auto address = network::discover(loop, options);
    if (!address) {
        throw Error("E_SERVER_NOT_FOUND", "No server found in the network",
                    "Make sure the netloader is running on the target or pass --address");
    }
    return *address;
}

std::string_view phase_name(LinkRunner::Phase phase) noexcept {
    switch (phase) {
        case LinkRunner::Phase::Preparing:
            return "preparing";
        case LinkRunner::Phase::Discovery:
            return "discovery";
        case LinkRunner::Phase::Upload:
            return "upload";
        case LinkRunner::Phase::Stdio:
            return "stdio";
        case LinkRunner::Phase::Finished:
            return "finished";
    }
    return "preparing";
}

}  // namespace nxlink::core
