#pragma once

#include "nxlink/Error.hpp"
#include "nxlink/core/EventLoop.hpp"
#include "nxlink/network/Socket.hpp"
#include "nxlink/protocol/Message.hpp"

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nxlink::network {

enum class TransferState {
    Idle,
    Connecting,
    HandshakeSent,
    AwaitingHandshakeAck,
    Streaming,
    AwaitingDataAck,
    SendingArgs,
    Done,
    Aborted
};

std::string_view transfer_state_name(TransferState state) noexcept;

struct TransferSession {
    Endpoint destination;
    std::string file_name;
    std::istream* reader{nullptr};
    std::uint64_t file_length{0};
    std::vector<std::string> arguments;
};

// The netloader server answered an acknowledgement with a non-zero code.
class PeerRejected : public Error {
public:
    enum class Stage {
        Handshake,
        Data
    };

    PeerRejected(Stage stage, std::int32_t raw_code);

    Stage stage() const noexcept { return stage_; }
    std::int32_t raw_code() const noexcept { return raw_code_; }
    // Only handshake acknowledgements are classified.
    const std::optional<protocol::PeerError>& peer_error() const noexcept { return peer_error_; }

private:
    Stage stage_;
    std::int32_t raw_code_;
    std::optional<protocol::PeerError> peer_error_;
};

// Uploads one file to a netloader server over a fresh TCP connection:
// name/length handshake, zlib-compressed data frames, argument frame.
// Single pass; a failure leaves the sender in TransferState::Aborted and the
// server in whatever partial state it reached.
class FileSender {
public:
    explicit FileSender(core::EventLoop& loop);

    FileSender(const FileSender&) = delete;
    FileSender& operator=(const FileSender&) = delete;

    void send(const TransferSession& session);

    TransferState state() const noexcept { return state_; }
    // State that was active when the transfer aborted.
    std::optional<TransferState> aborted_in() const noexcept { return aborted_in_; }
    std::uint64_t compressed_bytes_sent() const noexcept { return compressed_bytes_sent_; }
    std::size_t data_frames_sent() const noexcept { return data_frames_sent_; }

private:
    void run(const TransferSession& session);
    void send_handshake(TcpStream& stream, const TransferSession& session);
    void stream_file_data(TcpStream& stream, const TransferSession& session);
    void send_arguments(TcpStream& stream, const TransferSession& session);
    std::int32_t read_acknowledgement(TcpStream& stream);
    void transition(TransferState next);

    core::EventLoop& loop_;
    TransferState state_{TransferState::Idle};
    std::optional<TransferState> aborted_in_{};
    std::uint64_t compressed_bytes_sent_{0};
    std::size_t data_frames_sent_{0};
};

void send_file(core::EventLoop& loop, const TransferSession& session);

}  // namespace nxlink::network
