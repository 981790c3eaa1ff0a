#pragma once

#include "chunkswarm/Config.hpp"
#include "chunkswarm/server/HostedFileTable.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace chunkswarm::server {

class ChunkServer {
public:
    struct Statistics {
        std::uint64_t connections{0};
        std::uint64_t chunks_served{0};
        std::uint64_t bytes_served{0};
        std::uint64_t requests_rejected{0};
        std::uint64_t requests_failed{0};
        std::uint64_t connections_refused_busy{0};
    };

    ChunkServer(const HostedFileTable& files, Config config);
    ~ChunkServer();

    ChunkServer(const ChunkServer&) = delete;
    ChunkServer& operator=(const ChunkServer&) = delete;

    // Binds config.listen_host:config.listen_port. Throws std::runtime_error on bind failure.
    void start();
    void start(const std::string& host, std::uint16_t port);
    void stop();

    [[nodiscard]] bool running() const noexcept;
    // The bound port; useful after start() with port 0.
    [[nodiscard]] std::uint16_t listening_port() const noexcept;
    [[nodiscard]] Statistics statistics() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace chunkswarm::server
