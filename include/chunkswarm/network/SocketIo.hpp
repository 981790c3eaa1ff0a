#pragma once

#include "chunkswarm/Types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace chunkswarm::network {

using SocketHandle = std::intptr_t;
inline constexpr SocketHandle kInvalidSocket = static_cast<SocketHandle>(-1);

enum class IoStatus {
    Ok,
    Closed,
    TimedOut,
    Failed
};

const char* io_status_to_string(IoStatus status) noexcept;

void ensure_socket_runtime();
void close_socket(SocketHandle socket);

// Opens a TCP listener; throws std::runtime_error when the address cannot be bound.
SocketHandle open_listener(const std::string& host, std::uint16_t port, int backlog);
SocketHandle accept_connection(SocketHandle listener, std::string& remote_address);
std::uint16_t local_port(SocketHandle socket);

// Address of the interface holding the default route, or 127.0.0.1.
std::string discover_local_address();

// Connects with a bounded wait; a zero timeout blocks until the OS gives up.
SocketHandle connect_to(const PeerEndpoint& endpoint, std::chrono::milliseconds timeout, IoStatus& status);

bool set_socket_timeouts(SocketHandle socket, std::chrono::milliseconds timeout);
bool wait_readable(SocketHandle socket, std::chrono::milliseconds timeout);
void shutdown_socket(SocketHandle socket);

IoStatus send_all(SocketHandle socket, const std::uint8_t* data, std::size_t length);
IoStatus send_all(SocketHandle socket, const std::string& text);
IoStatus recv_exact(SocketHandle socket, std::uint8_t* buffer, std::size_t length);
// Single recv of at most capacity bytes; received is 0 when the peer closed.
IoStatus recv_some(SocketHandle socket, std::uint8_t* buffer, std::size_t capacity, std::size_t& received);

// Owns a socket handle for the lifetime of one connection.
class ScopedSocket {
public:
    ScopedSocket() = default;
    explicit ScopedSocket(SocketHandle socket) noexcept : socket_(socket) {}
    ~ScopedSocket() { close_socket(socket_); }

    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;

    ScopedSocket(ScopedSocket&& other) noexcept : socket_(other.release()) {}
    ScopedSocket& operator=(ScopedSocket&& other) noexcept {
        if (this != &other) {
            close_socket(socket_);
            socket_ = other.release();
        }
        return *this;
    }

    [[nodiscard]] SocketHandle get() const noexcept { return socket_; }
    [[nodiscard]] bool valid() const noexcept { return socket_ != kInvalidSocket; }

    SocketHandle release() noexcept {
        const auto socket = socket_;
        socket_ = kInvalidSocket;
        return socket;
    }

private:
    SocketHandle socket_{kInvalidSocket};
};

}  // namespace chunkswarm::network
