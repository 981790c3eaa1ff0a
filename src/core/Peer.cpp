#include "chunkswarm/core/Peer.hpp"

#include "chunkswarm/core/ChunkCodec.hpp"
#include "chunkswarm/daemon/StructuredLogger.hpp"
#include "chunkswarm/network/SocketIo.hpp"

#include <numeric>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

namespace chunkswarm {

namespace {
using daemon::StructuredLogger;
using daemon::log_event;
}

Peer::Peer(Config config, directory::Directory& directory)
    : config_(std::move(config)),
      directory_(directory),
      server_(files_, config_) {}

Peer::~Peer() {
    server_.stop();
}

Peer::ShareResult Peer::share(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw std::runtime_error("Not a regular file: " + path.string());
    }

    ShareResult result{};
    result.file = describe_file(path);
    result.advertised = advertised_endpoint();

    if (!files_.add(result.file.content_hash, path)) {
        log_event(StructuredLogger::Level::Info,
                  "peer.share.already_hosted",
                  {{"hash", result.file.content_hash}, {"path", path.string()}});
    }

    if (config_.share_cache_enabled) {
        result.cached_copy = cache_copy(path, result.file);
    }

    PeerAdvertisement advertisement{};
    advertisement.endpoint = result.advertised;
    advertisement.chunks.resize(result.file.chunk_count);
    std::iota(advertisement.chunks.begin(), advertisement.chunks.end(), ChunkIndex{0});
    result.registration = directory_.register_peer(result.file, advertisement);

    log_event(StructuredLogger::Level::Info,
              "peer.share",
              {{"name", result.file.name},
               {"hash", result.file.content_hash},
               {"size", std::to_string(result.file.size)},
               {"chunks", std::to_string(result.file.chunk_count)},
               {"endpoint", endpoint_to_string(result.advertised)},
               {"peers", std::to_string(result.registration.peers_count)}});
    return result;
}

void Peer::start_serving() {
    server_.start(config_.listen_host, config_.listen_port);
}

void Peer::stop_serving() {
    server_.stop();
}

bool Peer::serving() const noexcept {
    return server_.running();
}

PeerEndpoint Peer::advertised_endpoint() const {
    PeerEndpoint endpoint{};
    if (config_.advertise_host.has_value() && !config_.advertise_host->empty()) {
        endpoint.ip = *config_.advertise_host;
    } else if (!config_.listen_host.empty() && config_.listen_host != "0.0.0.0") {
        endpoint.ip = config_.listen_host;
    } else {
        endpoint.ip = network::discover_local_address();
    }
    endpoint.port = server_.running() ? server_.listening_port() : config_.listen_port;
    return endpoint;
}

DownloadOutcome Peer::download(const std::string& file_name, ProgressCallback progress) {
    DownloadOrchestrator orchestrator(directory_, config_);
    if (progress) {
        orchestrator.set_progress_callback(std::move(progress));
    }
    return orchestrator.download(file_name);
}

std::optional<std::filesystem::path> Peer::cache_copy(const std::filesystem::path& source, const FileDescriptor& file) {
    const std::filesystem::path directory(config_.download_directory);
    const auto target = directory / file.content_hash;
    std::error_code ec;
    if (std::filesystem::exists(target, ec)) {
        return target;
    }
    std::filesystem::create_directories(directory, ec);
    if (!ec) {
        std::filesystem::copy_file(source, target, ec);
    }
    if (ec) {
        log_event(StructuredLogger::Level::Warning,
                  "peer.share.cache_failed",
                  {{"target", target.string()}, {"error", ec.message()}});
        return std::nullopt;
    }
    return target;
}

}  // namespace chunkswarm
