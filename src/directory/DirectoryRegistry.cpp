#include "chunkswarm/directory/DirectoryRegistry.hpp"

#include "chunkswarm/core/ChunkCodec.hpp"
#include "chunkswarm/daemon/StructuredLogger.hpp"

#include <algorithm>

namespace chunkswarm::directory {

namespace {
constexpr const char* kRegisteredMessage = "Peer registered successfully";
constexpr const char* kUpdatedMessage = "Peer updated successfully";
}

RegistrationResult DirectoryRegistry::register_peer(const FileDescriptor& file, const PeerAdvertisement& peer) {
    RegistrationResult result{};
    {
        std::scoped_lock lock(mutex_);
        auto it = by_hash_.find(file.content_hash);
        if (it == by_hash_.end()) {
            FileRecord record{};
            record.file = file;
            record.file.chunk_count = chunk_count(file.size);
            records_.push_back(std::move(record));
            it = by_hash_.emplace(file.content_hash, records_.size() - 1).first;
        }

        auto& peers = records_[it->second].peers;
        const auto existing = std::find_if(peers.begin(), peers.end(), [&](const PeerAdvertisement& candidate) {
            return candidate.endpoint == peer.endpoint;
        });
        if (existing != peers.end()) {
            existing->chunks = peer.chunks;
            result.updated = true;
            result.message = kUpdatedMessage;
        } else {
            peers.push_back(peer);
            result.message = kRegisteredMessage;
        }
        result.peers_count = peers.size();
    }

    daemon::log_event(daemon::StructuredLogger::Level::Info,
                      "directory.register",
                      {{"hash", file.content_hash},
                       {"name", file.name},
                       {"peer", endpoint_to_string(peer.endpoint)},
                       {"chunks", std::to_string(peer.chunks.size())},
                       {"updated", result.updated ? "true" : "false"}});
    return result;
}

std::optional<LookupResult> DirectoryRegistry::lookup_by_name(const std::string& file_name) const {
    std::scoped_lock lock(mutex_);
    for (const auto& record : records_) {
        if (record.file.name == file_name) {
            return to_lookup(record);
        }
    }
    return std::nullopt;
}

std::vector<FileSummary> DirectoryRegistry::list_files() const {
    std::scoped_lock lock(mutex_);
    std::vector<FileSummary> files;
    files.reserve(records_.size());
    for (const auto& record : records_) {
        files.push_back(FileSummary{record.file, record.peers.size()});
    }
    return files;
}

std::size_t DirectoryRegistry::file_count() const {
    std::scoped_lock lock(mutex_);
    return records_.size();
}

LookupResult DirectoryRegistry::to_lookup(const FileRecord& record) {
    return LookupResult{record.file, record.peers};
}

RegistrationResult LocalDirectory::register_peer(const FileDescriptor& file, const PeerAdvertisement& peer) {
    return registry_.register_peer(file, peer);
}

std::optional<LookupResult> LocalDirectory::lookup(const std::string& file_name) {
    return registry_.lookup_by_name(file_name);
}

std::vector<FileSummary> LocalDirectory::list_files() {
    return registry_.list_files();
}

}  // namespace chunkswarm::directory
