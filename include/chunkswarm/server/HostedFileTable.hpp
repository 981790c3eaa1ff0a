#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace chunkswarm::server {

// Content hash -> absolute path of the backing file. Lookups take a shared lock,
// new shares take the exclusive one; entries live until the table is destroyed.
class HostedFileTable {
public:
    // Returns false when the hash is already hosted (the first path is kept).
    bool add(const std::string& content_hash, const std::filesystem::path& path);
    [[nodiscard]] std::optional<std::filesystem::path> find(const std::string& content_hash) const;
    [[nodiscard]] std::size_t size() const;

private:
    std::unordered_map<std::string, std::filesystem::path> files_;
    mutable std::shared_mutex mutex_;
};

}  // namespace chunkswarm::server
