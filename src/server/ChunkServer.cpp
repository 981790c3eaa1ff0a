#include "chunkswarm/server/ChunkServer.hpp"

#include "chunkswarm/core/ChunkCodec.hpp"
#include "chunkswarm/core/WorkerPool.hpp"
#include "chunkswarm/daemon/StructuredLogger.hpp"
#include "chunkswarm/network/SocketIo.hpp"
#include "chunkswarm/protocol/WireProtocol.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <exception>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace chunkswarm::server {

namespace {

using daemon::StructuredLogger;
using daemon::log_event;

// How long an unterminated request line may stall before it is taken as complete.
constexpr std::chrono::milliseconds kUnterminatedLineGrace{100};
constexpr int kListenBacklog = 128;

struct RequestLine {
    network::IoStatus status{network::IoStatus::Failed};
    std::string text;
};

RequestLine read_request_line(network::SocketHandle socket, std::size_t max_bytes) {
    RequestLine line;
    std::vector<std::uint8_t> buffer(max_bytes);
    std::size_t filled = 0;

    while (filled < max_bytes) {
        if (filled > 0 && !network::wait_readable(socket, kUnterminatedLineGrace)) {
            break;
        }
        std::size_t received = 0;
        const auto status = network::recv_some(socket, buffer.data() + filled, max_bytes - filled, received);
        if (status != network::IoStatus::Ok) {
            if (filled == 0) {
                line.status = status;
                return line;
            }
            break;
        }
        if (received == 0) {
            break;
        }
        const auto* begin = buffer.data() + filled;
        filled += received;
        bool terminated = false;
        for (const auto* it = begin; it != buffer.data() + filled; ++it) {
            if (*it == '\n') {
                filled = static_cast<std::size_t>(it - buffer.data());
                terminated = true;
                break;
            }
        }
        if (terminated) {
            break;
        }
    }

    if (filled == 0) {
        line.status = network::IoStatus::Closed;
        return line;
    }
    line.status = network::IoStatus::Ok;
    line.text.assign(reinterpret_cast<const char*>(buffer.data()), filled);
    return line;
}

ChunkData read_chunk_from_disk(const std::filesystem::path& path, const ChunkRange& range) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        throw std::runtime_error("Unable to open " + path.string());
    }
    stream.seekg(static_cast<std::streamoff>(range.offset), std::ios::beg);
    if (!stream) {
        throw std::runtime_error("Seek failed in " + path.string());
    }
    ChunkData data(static_cast<std::size_t>(range.length));
    stream.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (stream.bad()) {
        throw std::runtime_error("Read failed in " + path.string());
    }
    data.resize(static_cast<std::size_t>(stream.gcount()));
    return data;
}

}  // namespace

class ChunkServer::Impl {
public:
    Impl(const HostedFileTable& files, Config config)
        : files_(files),
          config_(std::move(config)) {
        network::ensure_socket_runtime();
    }

    ~Impl() {
        stop();
    }

    void start(const std::string& host, std::uint16_t port) {
        if (running_.load(std::memory_order_acquire)) {
            return;
        }

        listen_socket_ = network::open_listener(host, port, kListenBacklog);
        bound_port_ = network::local_port(listen_socket_);
        pool_ = std::make_unique<WorkerPool>(config_.server_worker_threads,
                                             config_.server_max_pending_connections,
                                             "chunk-server");
        running_.store(true, std::memory_order_release);
        accept_thread_ = std::thread(&Impl::accept_loop, this, listen_socket_);

        log_event(StructuredLogger::Level::Info,
                  "server.listening",
                  {{"host", host},
                   {"port", std::to_string(bound_port_)},
                   {"workers", std::to_string(pool_->thread_count())}});
    }

    void stop() {
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
        const auto socket = listen_socket_;
        listen_socket_ = network::kInvalidSocket;
        network::shutdown_socket(socket);
        network::close_socket(socket);
        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }
        if (pool_) {
            pool_->shutdown();
            pool_.reset();
        }
        log_event(StructuredLogger::Level::Info, "server.stopped", {{"port", std::to_string(bound_port_)}});
    }

    const Config& config() const noexcept {
        return config_;
    }

    bool running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    std::uint16_t listening_port() const noexcept {
        return bound_port_;
    }

    Statistics statistics() const noexcept {
        Statistics stats{};
        stats.connections = connections_.load(std::memory_order_relaxed);
        stats.chunks_served = chunks_served_.load(std::memory_order_relaxed);
        stats.bytes_served = bytes_served_.load(std::memory_order_relaxed);
        stats.requests_rejected = requests_rejected_.load(std::memory_order_relaxed);
        stats.requests_failed = requests_failed_.load(std::memory_order_relaxed);
        stats.connections_refused_busy = refused_busy_.load(std::memory_order_relaxed);
        return stats;
    }

private:
    const HostedFileTable& files_;
    Config config_;
    std::atomic<bool> running_{false};
    network::SocketHandle listen_socket_{network::kInvalidSocket};
    std::uint16_t bound_port_{0};
    std::thread accept_thread_;
    std::unique_ptr<WorkerPool> pool_;

    std::atomic<std::uint64_t> connections_{0};
    std::atomic<std::uint64_t> chunks_served_{0};
    std::atomic<std::uint64_t> bytes_served_{0};
    std::atomic<std::uint64_t> requests_rejected_{0};
    std::atomic<std::uint64_t> requests_failed_{0};
    std::atomic<std::uint64_t> refused_busy_{0};

    // Works on its own copy of the handle; only start() and stop() touch listen_socket_.
    void accept_loop(network::SocketHandle listener) {
        while (running_.load(std::memory_order_acquire)) {
            std::string remote;
            const auto client = network::accept_connection(listener, remote);
            if (client == network::kInvalidSocket) {
                if (running_.load(std::memory_order_acquire)) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                }
                continue;
            }
            connections_.fetch_add(1, std::memory_order_relaxed);
            if (!network::set_socket_timeouts(client, config_.server_socket_timeout)) {
                log_event(StructuredLogger::Level::Warning, "server.connection.timeout_unset", {{"remote", remote}});
            }

            auto connection = std::make_shared<network::ScopedSocket>(client);
            const bool queued = pool_->submit([this, connection, remote]() {
                handle_connection(connection->get(), remote);
            });
            if (!queued) {
                refused_busy_.fetch_add(1, std::memory_order_relaxed);
                log_event(StructuredLogger::Level::Warning,
                          "server.connection.busy",
                          {{"remote", remote}, {"pending", std::to_string(pool_->pending())}});
                static_cast<void>(network::send_all(connection->get(),
                                                    protocol::encode_error(protocol::kReasonServerBusy)));
            }
        }
    }

    void reject(network::SocketHandle client,
                const std::string& remote,
                std::string_view reason,
                StructuredLogger::FieldList fields = {}) {
        requests_rejected_.fetch_add(1, std::memory_order_relaxed);
        fields.emplace_back("remote", remote);
        fields.emplace_back("reason", std::string(reason));
        log_event(StructuredLogger::Level::Warning, "server.request.rejected", std::move(fields));
        const auto status = network::send_all(client, protocol::encode_error(reason));
        if (status != network::IoStatus::Ok) {
            log_event(StructuredLogger::Level::Warning,
                      "server.response.send_failed",
                      {{"remote", remote}, {"status", network::io_status_to_string(status)}});
        }
    }

    void handle_connection(network::SocketHandle client, const std::string& remote) {
        try {
            serve_request(client, remote);
        } catch (const std::exception& ex) {
            requests_failed_.fetch_add(1, std::memory_order_relaxed);
            log_event(StructuredLogger::Level::Error,
                      "server.request.failed",
                      {{"remote", remote}, {"error", ex.what()}});
            // Best effort; the peer may already be gone.
            static_cast<void>(network::send_all(client, protocol::encode_error(protocol::kReasonServerError)));
        }
    }

    void serve_request(network::SocketHandle client, const std::string& remote) {
        const auto line = read_request_line(client, config_.server_max_request_bytes);
        if (line.status != network::IoStatus::Ok) {
            log_event(StructuredLogger::Level::Warning,
                      "server.request.unreadable",
                      {{"remote", remote}, {"status", network::io_status_to_string(line.status)}});
            if (line.status == network::IoStatus::TimedOut) {
                reject(client, remote, protocol::kReasonInvalidRequest);
            }
            return;
        }

        const auto parsed = protocol::parse_request(line.text);
        if (!parsed.success) {
            reject(client, remote, protocol::request_error_reason(parsed.error));
            return;
        }

        const auto& request = parsed.request;
        const auto path = files_.find(request.content_hash);
        if (!path.has_value()) {
            reject(client, remote, protocol::kReasonFileNotFound, {{"hash", request.content_hash}});
            return;
        }

        std::error_code ec;
        const auto file_size = std::filesystem::file_size(*path, ec);
        if (ec) {
            throw std::runtime_error("Unable to stat " + path->string() + ": " + ec.message());
        }

        const auto count = chunk_count(static_cast<std::uint64_t>(file_size));
        if (request.chunk >= count) {
            reject(client,
                   remote,
                   protocol::kReasonChunkOutOfRange,
                   {{"hash", request.content_hash},
                    {"chunk", std::to_string(request.chunk)},
                    {"chunk_count", std::to_string(count)}});
            return;
        }

        const auto range = chunk_range(request.chunk, static_cast<std::uint64_t>(file_size));
        const auto data = read_chunk_from_disk(*path, range);

        const auto prefix = protocol::encode_length_prefix(static_cast<std::uint32_t>(data.size()));
        auto status = network::send_all(client, prefix.data(), prefix.size());
        if (status == network::IoStatus::Ok && !data.empty()) {
            status = network::send_all(client, data.data(), data.size());
        }
        if (status != network::IoStatus::Ok) {
            requests_failed_.fetch_add(1, std::memory_order_relaxed);
            log_event(StructuredLogger::Level::Warning,
                      "server.response.send_failed",
                      {{"remote", remote},
                       {"chunk", std::to_string(request.chunk)},
                       {"status", network::io_status_to_string(status)}});
            return;
        }

        chunks_served_.fetch_add(1, std::memory_order_relaxed);
        bytes_served_.fetch_add(static_cast<std::uint64_t>(data.size()), std::memory_order_relaxed);
        log_event(StructuredLogger::Level::Info,
                  "server.request.served",
                  {{"remote", remote},
                   {"hash", request.content_hash},
                   {"chunk", std::to_string(request.chunk)},
                   {"bytes", std::to_string(data.size())}});
    }
};

ChunkServer::ChunkServer(const HostedFileTable& files, Config config)
    : impl_(std::make_unique<Impl>(files, std::move(config))) {}

ChunkServer::~ChunkServer() = default;

void ChunkServer::start() {
    impl_->start(impl_->config().listen_host, impl_->config().listen_port);
}

void ChunkServer::start(const std::string& host, std::uint16_t port) {
    impl_->start(host, port);
}

void ChunkServer::stop() {
    impl_->stop();
}

bool ChunkServer::running() const noexcept {
    return impl_->running();
}

std::uint16_t ChunkServer::listening_port() const noexcept {
    return impl_->listening_port();
}

ChunkServer::Statistics ChunkServer::statistics() const noexcept {
    return impl_->statistics();
}

}  // namespace chunkswarm::server
