#include "chunkswarm/network/ChunkFetcher.hpp"

#include "chunkswarm/Config.hpp"
#include "chunkswarm/network/SocketIo.hpp"
#include "chunkswarm/protocol/WireProtocol.hpp"

#include <array>
#include <string_view>
#include <utility>

namespace chunkswarm::network {

namespace {

// Upper bound on how much of an error reply is kept for diagnostics.
constexpr std::size_t kMaxErrorReplyBytes = 256;

FetchStatus status_from_io(IoStatus status) {
    switch (status) {
        case IoStatus::Ok:
            return FetchStatus::Ok;
        case IoStatus::TimedOut:
            return FetchStatus::Timeout;
        case IoStatus::Closed:
        case IoStatus::Failed:
            break;
    }
    return FetchStatus::ShortRead;
}

FetchResult failure(ChunkIndex chunk, FetchStatus status, std::string detail) {
    FetchResult result{};
    result.status = status;
    result.chunk = chunk;
    result.detail = std::move(detail);
    return result;
}

// The four bytes taken as a length prefix may be the start of "ERROR: <reason>".
std::string drain_error_reply(SocketHandle socket, const std::array<std::uint8_t, protocol::kLengthPrefixSize>& head) {
    std::string reply(head.begin(), head.end());
    std::array<std::uint8_t, 64> buffer{};
    while (reply.size() < kMaxErrorReplyBytes) {
        std::size_t received = 0;
        if (recv_some(socket, buffer.data(), buffer.size(), received) != IoStatus::Ok || received == 0) {
            break;
        }
        reply.append(reinterpret_cast<const char*>(buffer.data()), received);
    }
    while (!reply.empty() && (reply.back() == '\n' || reply.back() == '\r')) {
        reply.pop_back();
    }
    return reply;
}

}  // namespace

const char* fetch_status_to_string(FetchStatus status) noexcept {
    switch (status) {
        case FetchStatus::Ok:
            return "ok";
        case FetchStatus::ConnectFailed:
            return "connect_failed";
        case FetchStatus::Timeout:
            return "timeout";
        case FetchStatus::ShortRead:
            return "short_read";
        case FetchStatus::FramingError:
            return "framing_error";
        case FetchStatus::PeerRejected:
            return "peer_rejected";
    }
    return "unknown";
}

FetchResult fetch_chunk(const PeerEndpoint& peer,
                        const std::string& content_hash,
                        ChunkIndex chunk,
                        std::chrono::milliseconds timeout) {
    IoStatus connect_status = IoStatus::Failed;
    ScopedSocket socket(connect_to(peer, timeout, connect_status));
    if (!socket.valid()) {
        return failure(chunk,
                       connect_status == IoStatus::TimedOut ? FetchStatus::Timeout : FetchStatus::ConnectFailed,
                       "connect to " + endpoint_to_string(peer) + " failed");
    }
    if (!set_socket_timeouts(socket.get(), timeout)) {
        return failure(chunk, FetchStatus::ConnectFailed, "unable to apply socket timeout");
    }

    const auto request = protocol::encode_request(content_hash, chunk);
    if (const auto status = send_all(socket.get(), request); status != IoStatus::Ok) {
        return failure(chunk, status_from_io(status), std::string("request write ") + io_status_to_string(status));
    }

    std::array<std::uint8_t, protocol::kLengthPrefixSize> prefix{};
    if (const auto status = recv_exact(socket.get(), prefix.data(), prefix.size()); status != IoStatus::Ok) {
        return failure(chunk, status_from_io(status), std::string("length prefix ") + io_status_to_string(status));
    }

    const auto length = protocol::decode_length_prefix(prefix.data());
    if (length > kChunkSize) {
        const auto reply = drain_error_reply(socket.get(), prefix);
        const auto error_tag = protocol::kErrorPrefix.substr(0, protocol::kErrorPrefix.size() - 1);
        if (std::string_view(reply).substr(0, error_tag.size()) == error_tag) {
            return failure(chunk, FetchStatus::PeerRejected, reply);
        }
        return failure(chunk, FetchStatus::FramingError, "length prefix " + std::to_string(length) + " exceeds chunk size");
    }

    FetchResult result{};
    result.chunk = chunk;
    result.data.resize(length);
    if (length > 0) {
        if (const auto status = recv_exact(socket.get(), result.data.data(), result.data.size()); status != IoStatus::Ok) {
            return failure(chunk, status_from_io(status), std::string("payload ") + io_status_to_string(status));
        }
    }
    result.status = FetchStatus::Ok;
    return result;
}

}  // namespace chunkswarm::network
