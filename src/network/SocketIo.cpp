#include "chunkswarm/network/SocketIo.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <winsock2.h>
#include <ws2tcpip.h>
#pragma comment(lib, "Ws2_32.lib")
#else
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace chunkswarm::network {

namespace {

#ifdef _WIN32
using NativeSocket = SOCKET;
constexpr NativeSocket kInvalidNativeSocket = INVALID_SOCKET;

class WinsockRuntime {
public:
    WinsockRuntime() {
        WSADATA data{};
        const auto result = WSAStartup(MAKEWORD(2, 2), &data);
        if (result != 0) {
            throw std::runtime_error("WSAStartup failed");
        }
    }
    ~WinsockRuntime() {
        WSACleanup();
    }
};

bool last_error_is_timeout() {
    const auto error = WSAGetLastError();
    return error == WSAETIMEDOUT || error == WSAEWOULDBLOCK;
}

int poll_sockets(WSAPOLLFD* fds, ULONG count, int timeout_ms) {
    return WSAPoll(fds, count, timeout_ms);
}

using PollFd = WSAPOLLFD;
#else
using NativeSocket = int;
constexpr NativeSocket kInvalidNativeSocket = -1;

bool last_error_is_timeout() {
    return errno == EAGAIN || errno == EWOULDBLOCK || errno == ETIMEDOUT;
}

int poll_sockets(pollfd* fds, nfds_t count, int timeout_ms) {
    int result = 0;
    do {
        result = ::poll(fds, count, timeout_ms);
    } while (result < 0 && errno == EINTR);
    return result;
}

using PollFd = pollfd;
#endif

NativeSocket to_native(SocketHandle handle) {
    return static_cast<NativeSocket>(handle);
}

SocketHandle from_native(NativeSocket socket) {
    if (socket == kInvalidNativeSocket) {
        return kInvalidSocket;
    }
    return static_cast<SocketHandle>(socket);
}

bool set_non_blocking(NativeSocket socket, bool enabled) {
#ifdef _WIN32
    u_long mode = enabled ? 1 : 0;
    return ::ioctlsocket(socket, FIONBIO, &mode) == 0;
#else
    const int flags = ::fcntl(socket, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    const int updated = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return ::fcntl(socket, F_SETFL, updated) == 0;
#endif
}

bool resolve_ipv4(const std::string& host, in_addr& out) {
    if (::inet_pton(AF_INET, host.c_str(), &out) == 1) {
        return true;
    }
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* results = nullptr;
    if (::getaddrinfo(host.c_str(), nullptr, &hints, &results) != 0 || results == nullptr) {
        return false;
    }
    out = reinterpret_cast<const sockaddr_in*>(results->ai_addr)->sin_addr;
    ::freeaddrinfo(results);
    return true;
}

}  // namespace

const char* io_status_to_string(IoStatus status) noexcept {
    switch (status) {
        case IoStatus::Ok:
            return "ok";
        case IoStatus::Closed:
            return "closed";
        case IoStatus::TimedOut:
            return "timeout";
        case IoStatus::Failed:
            return "failed";
    }
    return "failed";
}

void ensure_socket_runtime() {
#ifdef _WIN32
    static WinsockRuntime runtime;
    (void)runtime;
#endif
}

void close_socket(SocketHandle handle) {
    if (handle == kInvalidSocket) {
        return;
    }
#ifdef _WIN32
    ::closesocket(to_native(handle));
#else
    ::close(to_native(handle));
#endif
}

void shutdown_socket(SocketHandle handle) {
    if (handle == kInvalidSocket) {
        return;
    }
#ifdef _WIN32
    ::shutdown(to_native(handle), SD_BOTH);
#else
    ::shutdown(to_native(handle), SHUT_RDWR);
#endif
}

SocketHandle open_listener(const std::string& host, std::uint16_t port, int backlog) {
    ensure_socket_runtime();

    const NativeSocket server = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (server == kInvalidNativeSocket) {
        throw std::runtime_error("Failed to create listening socket");
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (host.empty() || host == "0.0.0.0") {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        close_socket(from_native(server));
        throw std::runtime_error("Invalid listen host: " + host);
    }

    const int opt = 1;
    ::setsockopt(server, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&opt), sizeof(opt));

    if (::bind(server, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        close_socket(from_native(server));
        throw std::runtime_error("Failed to bind " + host + ":" + std::to_string(port));
    }

    if (::listen(server, backlog) < 0) {
        close_socket(from_native(server));
        throw std::runtime_error("Failed to listen on " + host + ":" + std::to_string(port));
    }

    return from_native(server);
}

SocketHandle accept_connection(SocketHandle listener, std::string& remote_address) {
    sockaddr_in client_addr{};
#ifdef _WIN32
    int addr_len = sizeof(client_addr);
#else
    socklen_t addr_len = sizeof(client_addr);
#endif
    const auto client = ::accept(to_native(listener), reinterpret_cast<sockaddr*>(&client_addr), &addr_len);
    if (client == kInvalidNativeSocket) {
        return kInvalidSocket;
    }
    remote_address = "unknown";
    char buffer[INET_ADDRSTRLEN] = {0};
    if (::inet_ntop(AF_INET, &client_addr.sin_addr, buffer, sizeof(buffer)) != nullptr) {
        remote_address = std::string(buffer) + ":" + std::to_string(ntohs(client_addr.sin_port));
    }
    return from_native(client);
}

std::uint16_t local_port(SocketHandle handle) {
    sockaddr_in addr{};
#ifdef _WIN32
    int len = sizeof(addr);
#else
    socklen_t len = sizeof(addr);
#endif
    if (::getsockname(to_native(handle), reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

std::string discover_local_address() {
    ensure_socket_runtime();
    const std::string fallback = "127.0.0.1";

    const NativeSocket probe = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (probe == kInvalidNativeSocket) {
        return fallback;
    }
    ScopedSocket guard(from_native(probe));

    // Connecting a datagram socket only selects a route; nothing is sent.
    sockaddr_in remote{};
    remote.sin_family = AF_INET;
    remote.sin_port = htons(80);
    if (::inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr) != 1
        || ::connect(probe, reinterpret_cast<const sockaddr*>(&remote), sizeof(remote)) < 0) {
        return fallback;
    }

    sockaddr_in local{};
#ifdef _WIN32
    int len = sizeof(local);
#else
    socklen_t len = sizeof(local);
#endif
    if (::getsockname(probe, reinterpret_cast<sockaddr*>(&local), &len) != 0) {
        return fallback;
    }
    char buffer[INET_ADDRSTRLEN] = {0};
    if (::inet_ntop(AF_INET, &local.sin_addr, buffer, sizeof(buffer)) == nullptr) {
        return fallback;
    }
    const std::string address(buffer);
    return address == "0.0.0.0" ? fallback : address;
}

SocketHandle connect_to(const PeerEndpoint& endpoint, std::chrono::milliseconds timeout, IoStatus& status) {
    ensure_socket_runtime();
    status = IoStatus::Failed;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(endpoint.port);
    if (!resolve_ipv4(endpoint.ip, addr.sin_addr)) {
        return kInvalidSocket;
    }

    const NativeSocket socket = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (socket == kInvalidNativeSocket) {
        return kInvalidSocket;
    }

    if (timeout.count() <= 0) {
        if (::connect(socket, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
            close_socket(from_native(socket));
            return kInvalidSocket;
        }
        status = IoStatus::Ok;
        return from_native(socket);
    }

    if (!set_non_blocking(socket, true)) {
        close_socket(from_native(socket));
        return kInvalidSocket;
    }

    if (::connect(socket, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
#ifdef _WIN32
        const bool in_progress = WSAGetLastError() == WSAEWOULDBLOCK;
#else
        const bool in_progress = errno == EINPROGRESS;
#endif
        if (!in_progress) {
            close_socket(from_native(socket));
            return kInvalidSocket;
        }

        PollFd fd{};
        fd.fd = socket;
        fd.events = POLLOUT;
        const auto ready = poll_sockets(&fd, 1, static_cast<int>(timeout.count()));
        if (ready == 0) {
            status = IoStatus::TimedOut;
            close_socket(from_native(socket));
            return kInvalidSocket;
        }
        int error = 0;
#ifdef _WIN32
        int error_len = sizeof(error);
#else
        socklen_t error_len = sizeof(error);
#endif
        if (ready < 0 ||
            ::getsockopt(socket, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&error), &error_len) != 0 ||
            error != 0) {
            close_socket(from_native(socket));
            return kInvalidSocket;
        }
    }

    if (!set_non_blocking(socket, false)) {
        close_socket(from_native(socket));
        return kInvalidSocket;
    }

    status = IoStatus::Ok;
    return from_native(socket);
}

bool set_socket_timeouts(SocketHandle handle, std::chrono::milliseconds timeout) {
    const auto socket = to_native(handle);
#ifdef _WIN32
    DWORD value = static_cast<DWORD>(timeout.count());
    const auto* option = reinterpret_cast<const char*>(&value);
    const int option_len = sizeof(value);
#else
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    const auto* option = reinterpret_cast<const char*>(&tv);
    const socklen_t option_len = sizeof(tv);
#endif
    if (::setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, option, option_len) < 0) {
        return false;
    }
    if (::setsockopt(socket, SOL_SOCKET, SO_SNDTIMEO, option, option_len) < 0) {
        return false;
    }
    return true;
}

bool wait_readable(SocketHandle handle, std::chrono::milliseconds timeout) {
    PollFd fd{};
    fd.fd = to_native(handle);
    fd.events = POLLIN;
    return poll_sockets(&fd, 1, static_cast<int>(timeout.count())) > 0;
}

IoStatus send_all(SocketHandle handle, const std::uint8_t* data, std::size_t length) {
    const auto socket = to_native(handle);
#ifdef MSG_NOSIGNAL
    constexpr int kSendFlags = MSG_NOSIGNAL;
#else
    constexpr int kSendFlags = 0;
#endif
    std::size_t total_sent = 0;
    while (total_sent < length) {
#ifdef _WIN32
        const auto sent = ::send(socket, reinterpret_cast<const char*>(data + total_sent),
                                 static_cast<int>(length - total_sent), kSendFlags);
#else
        const auto sent = ::send(socket, reinterpret_cast<const char*>(data + total_sent),
                                 length - total_sent, kSendFlags);
#endif
        if (sent < 0) {
#ifndef _WIN32
            if (errno == EINTR) {
                continue;
            }
#endif
            return last_error_is_timeout() ? IoStatus::TimedOut : IoStatus::Failed;
        }
        if (sent == 0) {
            return IoStatus::Closed;
        }
        total_sent += static_cast<std::size_t>(sent);
    }
    return IoStatus::Ok;
}

IoStatus send_all(SocketHandle socket, const std::string& text) {
    return send_all(socket, reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

IoStatus recv_exact(SocketHandle socket, std::uint8_t* buffer, std::size_t length) {
    std::size_t received_total = 0;
    while (received_total < length) {
        std::size_t received = 0;
        const auto status = recv_some(socket, buffer + received_total, length - received_total, received);
        if (status != IoStatus::Ok) {
            return status;
        }
        if (received == 0) {
            return IoStatus::Closed;
        }
        received_total += received;
    }
    return IoStatus::Ok;
}

IoStatus recv_some(SocketHandle handle, std::uint8_t* buffer, std::size_t capacity, std::size_t& received) {
    const auto socket = to_native(handle);
    received = 0;
    while (true) {
#ifdef _WIN32
        const auto count = ::recv(socket, reinterpret_cast<char*>(buffer), static_cast<int>(capacity), 0);
#else
        const auto count = ::recv(socket, reinterpret_cast<char*>(buffer), capacity, 0);
#endif
        if (count < 0) {
#ifndef _WIN32
            if (errno == EINTR) {
                continue;
            }
#endif
            return last_error_is_timeout() ? IoStatus::TimedOut : IoStatus::Failed;
        }
        received = static_cast<std::size_t>(count);
        return IoStatus::Ok;
    }
}

}  // namespace chunkswarm::network
