#pragma once

#include "chunkswarm/directory/Directory.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkswarm::directory {

// In-memory record of which peers hold which chunks of which file. Files keep the
// name and size of their first registration; a peer is identified by (hash, ip, port).
class DirectoryRegistry {
public:
    RegistrationResult register_peer(const FileDescriptor& file, const PeerAdvertisement& peer);

    // When several hashes share a name, the earliest registered one answers.
    [[nodiscard]] std::optional<LookupResult> lookup_by_name(const std::string& file_name) const;
    [[nodiscard]] std::vector<FileSummary> list_files() const;
    [[nodiscard]] std::size_t file_count() const;

private:
    struct FileRecord {
        FileDescriptor file;
        std::vector<PeerAdvertisement> peers;
    };

    static LookupResult to_lookup(const FileRecord& record);

    std::vector<FileRecord> records_;
    std::unordered_map<std::string, std::size_t> by_hash_;
    mutable std::mutex mutex_;
};

// Directory backed by a registry in the same process.
class LocalDirectory : public Directory {
public:
    explicit LocalDirectory(DirectoryRegistry& registry) : registry_(registry) {}

    RegistrationResult register_peer(const FileDescriptor& file, const PeerAdvertisement& peer) override;
    std::optional<LookupResult> lookup(const std::string& file_name) override;
    std::vector<FileSummary> list_files() override;

private:
    DirectoryRegistry& registry_;
};

}  // namespace chunkswarm::directory
