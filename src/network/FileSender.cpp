#include "nxlink/network/FileSender.hpp"

#include "nxlink/protocol/Frame.hpp"
#include "nxlink/util/StructuredLogger.hpp"

#include <array>
#include <cerrno>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <zlib.h>

namespace nxlink::network {

namespace {

using util::StructuredLogger;

std::string format_percent(std::uint64_t done, std::uint64_t total) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << (total == 0 ? 100.0 : (static_cast<double>(done) * 100.0) / static_cast<double>(total));
    return oss.str();
}

std::string peer_rejection_message(PeerRejected::Stage stage, std::int32_t code) {
    if (stage == PeerRejected::Stage::Data) {
        return "Unknown error (code " + std::to_string(code) + ")";
    }
    const auto error = protocol::classify_acknowledgement(code);
    return error ? protocol::describe_peer_error(*error) : std::string{"Unexpected success code"};
}

// Owns a zlib deflate stream for one transfer.
class DeflateStream {
public:
    DeflateStream() {
        if (::deflateInit(&stream_, Z_DEFAULT_COMPRESSION) != Z_OK) {
            throw std::runtime_error("deflateInit failed");
        }
    }

    ~DeflateStream() {
        ::deflateEnd(&stream_);
    }

    DeflateStream(const DeflateStream&) = delete;
    DeflateStream& operator=(const DeflateStream&) = delete;

    z_stream* get() { return &stream_; }

private:
    z_stream stream_{};
};

}  // namespace

std::string_view transfer_state_name(TransferState state) noexcept {
    switch (state) {
        case TransferState::Idle:
            return "idle";
        case TransferState::Connecting:
            return "connecting";
        case TransferState::HandshakeSent:
            return "handshake-sent";
        case TransferState::AwaitingHandshakeAck:
            return "awaiting-handshake-ack";
        case TransferState::Streaming:
            return "streaming";
        case TransferState::AwaitingDataAck:
            return "awaiting-data-ack";
        case TransferState::SendingArgs:
            return "sending-args";
        case TransferState::Done:
            return "done";
        case TransferState::Aborted:
            return "aborted";
    }
    return "idle";
}

PeerRejected::PeerRejected(Stage stage, std::int32_t raw_code)
    : Error(stage == Stage::Handshake ? "E_PEER_REJECTED_HANDSHAKE" : "E_PEER_REJECTED_DATA",
            peer_rejection_message(stage, raw_code)),
      stage_(stage),
      raw_code_(raw_code) {
    if (stage_ == Stage::Handshake) {
        peer_error_ = protocol::classify_acknowledgement(raw_code_);
    }
}

FileSender::FileSender(core::EventLoop& loop)
    : loop_(loop) {}

void FileSender::send(const TransferSession& session) {
    if (state_ != TransferState::Idle) {
        throw std::logic_error("FileSender instances are single-use");
    }
    if (session.reader == nullptr) {
        throw std::invalid_argument("TransferSession requires a reader");
    }
    if (session.file_length > std::numeric_limits<std::uint32_t>::max()) {
        throw Error("E_FILE_TOO_LARGE",
                    "File length " + std::to_string(session.file_length) + " does not fit the 32-bit length field");
    }

    try {
        run(session);
    } catch (...) {
        aborted_in_ = state_;
        state_ = TransferState::Aborted;
        StructuredLogger::instance().debug("upload.aborted",
                                           {{"state", std::string(transfer_state_name(*aborted_in_))}});
        throw;
    }
}

void FileSender::run(const TransferSession& session) {
    transition(TransferState::Connecting);
    auto stream = TcpStream::connect(loop_, session.destination);

    send_handshake(stream, session);

    transition(TransferState::AwaitingHandshakeAck);
    if (const auto code = read_acknowledgement(stream); code != 0) {
        throw PeerRejected(PeerRejected::Stage::Handshake, code);
    }

    transition(TransferState::Streaming);
    stream_file_data(stream, session);

    transition(TransferState::AwaitingDataAck);
    if (const auto code = read_acknowledgement(stream); code != 0) {
        throw PeerRejected(PeerRejected::Stage::Data, code);
    }

    transition(TransferState::SendingArgs);
    send_arguments(stream, session);

    transition(TransferState::Done);
}

void FileSender::send_handshake(TcpStream& stream, const TransferSession& session) {
    const auto* name = reinterpret_cast<const std::uint8_t*>(session.file_name.data());
    auto handshake = protocol::encode_frame(std::span<const std::uint8_t>(name, session.file_name.size()));
    protocol::append_u32_le(handshake, static_cast<std::uint32_t>(session.file_length));
    // The state covers the write itself so an abort mid-handshake reports it.
    transition(TransferState::HandshakeSent);
    stream.write_all(handshake);
}

void FileSender::stream_file_data(TcpStream& stream, const TransferSession& session) {
    auto& logger = StructuredLogger::instance();
    auto& reader = *session.reader;

    DeflateStream deflate;
    std::vector<std::uint8_t> input(protocol::kMaxChunkSize);
    std::vector<std::uint8_t> output(protocol::kMaxChunkSize);
    std::uint64_t consumed = 0;

    bool finished = false;
    while (!finished) {
        loop_.throw_if_cancelled();

        std::size_t read_len = 0;
        if (reader.good()) {
            reader.read(reinterpret_cast<char*>(input.data()), static_cast<std::streamsize>(input.size()));
            read_len = static_cast<std::size_t>(reader.gcount());
        }
        if (reader.bad()) {
            throw std::system_error(EIO, std::generic_category(), "reading " + session.file_name + " failed");
        }
        consumed += read_len;

        const int flush = read_len == 0 ? Z_FINISH : Z_NO_FLUSH;
        auto* z = deflate.get();
        z->next_in = input.data();
        z->avail_in = static_cast<uInt>(read_len);

        int rc = Z_OK;
        do {
            z->next_out = output.data();
            z->avail_out = static_cast<uInt>(output.size());
            rc = ::deflate(z, flush);
            if (rc == Z_STREAM_ERROR) {
                throw std::runtime_error("deflate failed");
            }
            const auto produced = output.size() - z->avail_out;
            if (produced == 0) {
                continue;
            }

            stream.write_all(protocol::encode_frame(std::span<const std::uint8_t>(output.data(), produced)));
            compressed_bytes_sent_ += produced;
            ++data_frames_sent_;
            logger.debug("upload.progress", {{"bytes_sent", std::to_string(consumed)},
                                             {"percent", format_percent(consumed, session.file_length)},
                                             {"frame_bytes", std::to_string(produced)}});
        } while (z->avail_out == 0);

        finished = flush == Z_FINISH && rc == Z_STREAM_END;
    }
}

void FileSender::send_arguments(TcpStream& stream, const TransferSession& session) {
    const auto blob = protocol::build_argument_blob(session.arguments);
    stream.write_all(protocol::encode_frame(blob));
}

std::int32_t FileSender::read_acknowledgement(TcpStream& stream) {
    std::array<std::uint8_t, sizeof(std::int32_t)> buffer{};
    stream.read_exact(buffer);
    return protocol::read_i32_le(buffer.data());
}

void FileSender::transition(TransferState next) {
    StructuredLogger::instance().debug("upload.state", {{"from", std::string(transfer_state_name(state_))},
                                                        {"to", std::string(transfer_state_name(next))}});
    state_ = next;
}

void send_file(core::EventLoop& loop, const TransferSession& session) {
    FileSender sender{loop};
    sender.send(session);
}

}  // namespace nxlink::network
