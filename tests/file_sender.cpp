#include "nxlink/Error.hpp"
#include "nxlink/core/CancellationToken.hpp"
#include "nxlink/core/EventLoop.hpp"
#include "nxlink/network/FileSender.hpp"
#include "nxlink/protocol/Message.hpp"

#include "loopback_peer.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

using namespace std::chrono_literals;
using namespace nxlink;
using nxlink::test::ScriptedServer;

namespace {

std::string make_payload(std::size_t size, bool compressible) {
    std::string data(size, '\0');
    if (compressible) {
        for (std::size_t i = 0; i < size; ++i) {
            data[i] = static_cast<char>('a' + (i % 7));
        }
        return data;
    }
    std::mt19937 rng{1234};
    for (auto& ch : data) {
        ch = static_cast<char>(rng() & 0xFF);
    }
    return data;
}

network::TransferSession make_session(std::uint16_t port,
                                      std::istream& reader,
                                      std::uint64_t length,
                                      std::vector<std::string> arguments = {}) {
    network::TransferSession session{};
    session.destination = network::Endpoint{"127.0.0.1", port};
    session.file_name = "switch/app.nro";
    session.reader = &reader;
    session.file_length = length;
    session.arguments = std::move(arguments);
    return session;
}

std::int32_t rejected_code(std::int32_t handshake_ack, std::int32_t data_ack,
                           network::PeerRejected::Stage expected_stage,
                           network::TransferState expected_abort_state) {
    ScriptedServer server{handshake_ack, data_ack};
    const auto payload = make_payload(1000, true);
    std::istringstream reader(payload);
    core::EventLoop loop;
    network::FileSender sender{loop};
    std::int32_t code = 0;
    try {
        sender.send(make_session(server.port(), reader, payload.size()));
        assert(false && "send should have been rejected");
    } catch (const network::PeerRejected& ex) {
        assert(ex.stage() == expected_stage);
        code = ex.raw_code();
    }
    assert(sender.state() == network::TransferState::Aborted);
    assert(sender.aborted_in() == expected_abort_state);
    const auto& record = server.finish();
    assert(record.failure.empty());
    return code;
}

}  // namespace

int main() {
    try {
        {
            // Accepted upload: name frame, length, data frames, argument frame.
            ScriptedServer server{0, 0};
            const auto payload = make_payload(100 * 1024, true);
            std::istringstream reader(payload);
            core::EventLoop loop;
            network::FileSender sender{loop};
            sender.send(make_session(server.port(), reader, payload.size(), {"switch/app.nro", "--debug"}));
            assert(sender.state() == network::TransferState::Done);
            assert(!sender.aborted_in().has_value());

            const auto& record = server.finish();
            assert(record.failure.empty());
            assert(record.name == "switch/app.nro");
            assert(record.length == payload.size());
            assert(record.stream_ended);
            assert(std::string(record.inflated.begin(), record.inflated.end()) == payload);
            assert(record.data_frames == sender.data_frames_sent());
            assert(record.data_frames >= 1);
            assert(record.arguments_received);
            assert(std::string(record.arguments.begin(), record.arguments.end()) ==
                   std::string("switch/app.nro\0--debug\0", 23));
            assert(record.trailing_bytes == 0);
        }

        {
            // Incompressible input still never yields a frame above 16 KiB.
            ScriptedServer server{0, 0};
            const auto payload = make_payload(200 * 1024, false);
            std::istringstream reader(payload);
            core::EventLoop loop;
            network::FileSender sender{loop};
            sender.send(make_session(server.port(), reader, payload.size()));

            const auto& record = server.finish();
            assert(record.failure.empty());
            assert(record.largest_frame <= protocol::kMaxChunkSize);
            assert(record.data_frames > 1);
            assert(record.inflated.size() == payload.size());
            assert(sender.compressed_bytes_sent() > payload.size() / 2);
            assert(record.arguments_received);
            assert(record.arguments.empty());
        }

        {
            // Empty file: the stream is only the zlib trailer.
            ScriptedServer server{0, 0};
            std::istringstream reader{std::string{}};
            core::EventLoop loop;
            network::send_file(loop, make_session(server.port(), reader, 0));
            const auto& record = server.finish();
            assert(record.failure.empty());
            assert(record.length == 0);
            assert(record.inflated.empty());
            assert(record.stream_ended);
        }

        {
            // Insufficient space after the handshake: no data frames follow.
            ScriptedServer server{-2, 0};
            const auto payload = make_payload(4096, true);
            std::istringstream reader(payload);
            core::EventLoop loop;
            network::FileSender sender{loop};
            bool rejected = false;
            try {
                sender.send(make_session(server.port(), reader, payload.size()));
            } catch (const network::PeerRejected& ex) {
                rejected = true;
                assert(ex.stage() == network::PeerRejected::Stage::Handshake);
                assert(ex.code() == "E_PEER_REJECTED_HANDSHAKE");
                assert(ex.peer_error().has_value());
                assert(std::holds_alternative<protocol::InsufficientSpace>(*ex.peer_error()));
                assert(ex.message() == "Insufficient space");
            }
            assert(rejected);
            assert(sender.data_frames_sent() == 0);
            const auto& record = server.finish();
            assert(record.data_frames == 0);
            assert(record.trailing_bytes == 0);
        }

        {
            assert(rejected_code(-1, 0, network::PeerRejected::Stage::Handshake,
                                 network::TransferState::AwaitingHandshakeAck) == -1);
            assert(rejected_code(-3, 0, network::PeerRejected::Stage::Handshake,
                                 network::TransferState::AwaitingHandshakeAck) == -3);
            assert(rejected_code(7, 0, network::PeerRejected::Stage::Handshake,
                                 network::TransferState::AwaitingHandshakeAck) == 7);
            assert(rejected_code(0, -2, network::PeerRejected::Stage::Data,
                                 network::TransferState::AwaitingDataAck) == -2);
        }

        {
            // The data acknowledgement is reported without classification.
            const network::PeerRejected data{network::PeerRejected::Stage::Data, -2};
            assert(!data.peer_error().has_value());
            assert(data.code() == "E_PEER_REJECTED_DATA");
            assert(data.message() == "Unknown error (code -2)");

            const network::PeerRejected handshake{network::PeerRejected::Stage::Handshake, 7};
            assert(handshake.peer_error().has_value());
            assert(handshake.message() == "Unknown error: 7");
        }

        {
            // Server closes right after the handshake without acknowledging.
            auto listener = test::listen_tcp();
            const auto port = test::bound_port(listener.get());
            std::thread peer([&]() {
                test::PeerSocket client{::accept(listener.get(), nullptr, nullptr)};
                test::read_frame(client.get());
                test::read_u32(client.get());
            });
            const auto payload = make_payload(64, true);
            std::istringstream reader(payload);
            core::EventLoop loop;
            network::FileSender sender{loop};
            bool failed = false;
            try {
                sender.send(make_session(port, reader, payload.size()));
            } catch (const std::system_error& ex) {
                failed = true;
                assert(ex.code().value() == ECONNRESET);
            }
            peer.join();
            assert(failed);
            assert(sender.aborted_in() == network::TransferState::AwaitingHandshakeAck);
        }

        {
            // A handshake write stuck on a peer that never reads aborts in HandshakeSent.
            auto listener = test::listen_tcp();
            const auto port = test::bound_port(listener.get());
            core::CancellationToken token;
            std::thread peer([&]() {
                test::PeerSocket client{::accept(listener.get(), nullptr, nullptr)};
                std::this_thread::sleep_for(100ms);
                token.cancel();
            });
            std::istringstream reader{std::string{"data"}};
            core::EventLoop loop{&token};
            network::FileSender sender{loop};
            auto session = make_session(port, reader, 4);
            session.file_name.assign(32u << 20, 'n');
            bool cancelled = false;
            try {
                sender.send(session);
            } catch (const OperationCancelled&) {
                cancelled = true;
            }
            peer.join();
            assert(cancelled);
            assert(sender.aborted_in() == network::TransferState::HandshakeSent);
        }

        {
            // Nothing listening.
            auto listener = test::listen_tcp();
            const auto port = test::bound_port(listener.get());
            listener.close();
            std::istringstream reader{std::string{"x"}};
            core::EventLoop loop;
            network::FileSender sender{loop};
            bool failed = false;
            try {
                sender.send(make_session(port, reader, 1));
            } catch (const std::system_error& ex) {
                failed = ex.code() == std::errc::connection_refused;
            }
            assert(failed);
            assert(sender.aborted_in() == network::TransferState::Connecting);
        }

        {
            // A cancelled token aborts while waiting for the acknowledgement.
            auto listener = test::listen_tcp();
            const auto port = test::bound_port(listener.get());
            core::CancellationToken token;
            std::thread peer([&]() {
                test::PeerSocket client{::accept(listener.get(), nullptr, nullptr)};
                test::read_frame(client.get());
                test::read_u32(client.get());
                std::this_thread::sleep_for(50ms);
                token.cancel();
                std::uint8_t byte{};
                test::set_receive_timeout(client.get(), 2s);
                ::recv(client.get(), &byte, 1, 0);
            });
            std::istringstream reader{std::string{"data"}};
            core::EventLoop loop{&token};
            network::FileSender sender{loop};
            bool cancelled = false;
            try {
                sender.send(make_session(port, reader, 4));
            } catch (const OperationCancelled&) {
                cancelled = true;
            }
            peer.join();
            assert(cancelled);
            assert(sender.aborted_in() == network::TransferState::AwaitingHandshakeAck);
        }

        {
            std::istringstream reader{std::string{}};
            core::EventLoop loop;
            network::FileSender sender{loop};
            auto session = make_session(1, reader, 0x100000000ull);
            bool too_large = false;
            try {
                sender.send(session);
            } catch (const Error& ex) {
                too_large = ex.code() == "E_FILE_TOO_LARGE";
            }
            assert(too_large);
        }
    } catch (const std::exception& ex) {
        std::cerr << "file sender test failed: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
