#include "chunkswarm/server/HostedFileTable.hpp"

#include <mutex>
#include <system_error>

namespace chunkswarm::server {

bool HostedFileTable::add(const std::string& content_hash, const std::filesystem::path& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    std::unique_lock lock(mutex_);
    return files_.emplace(content_hash, absolute.lexically_normal()).second;
}

std::optional<std::filesystem::path> HostedFileTable::find(const std::string& content_hash) const {
    std::shared_lock lock(mutex_);
    const auto it = files_.find(content_hash);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t HostedFileTable::size() const {
    std::shared_lock lock(mutex_);
    return files_.size();
}

}  // namespace chunkswarm::server
