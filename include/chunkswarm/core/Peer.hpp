#pragma once

#include "chunkswarm/Config.hpp"
#include "chunkswarm/Types.hpp"
#include "chunkswarm/core/DownloadOrchestrator.hpp"
#include "chunkswarm/directory/Directory.hpp"
#include "chunkswarm/server/ChunkServer.hpp"
#include "chunkswarm/server/HostedFileTable.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace chunkswarm {

class Peer {
public:
    struct ShareResult {
        FileDescriptor file;
        PeerEndpoint advertised;
        directory::RegistrationResult registration;
        std::optional<std::filesystem::path> cached_copy;
    };

    Peer(Config config, directory::Directory& directory);
    ~Peer();

    Peer(const Peer&) = delete;
    Peer& operator=(const Peer&) = delete;

    // Hashes the file, adds it to the hosted table and registers every chunk with the
    // directory under advertised_endpoint(). Start serving first when listen_port is 0.
    ShareResult share(const std::filesystem::path& path);

    void start_serving();
    void stop_serving();
    [[nodiscard]] bool serving() const noexcept;

    [[nodiscard]] PeerEndpoint advertised_endpoint() const;

    DownloadOutcome download(const std::string& file_name, ProgressCallback progress = {});

    [[nodiscard]] const server::HostedFileTable& hosted_files() const noexcept { return files_; }
    [[nodiscard]] server::ChunkServer::Statistics server_statistics() const noexcept { return server_.statistics(); }
    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    std::optional<std::filesystem::path> cache_copy(const std::filesystem::path& source, const FileDescriptor& file);

    Config config_;
    directory::Directory& directory_;
    server::HostedFileTable files_;
    server::ChunkServer server_;
};

}  // namespace chunkswarm
