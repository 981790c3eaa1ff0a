#pragma once

#include "chunkswarm/Errors.hpp"
#include "chunkswarm/Types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace chunkswarm::directory {

struct RegistrationResult {
    bool updated{false};  // the (hash, ip, port) triple was already registered
    std::size_t peers_count{0};
    std::string message;
};

struct LookupResult {
    // content_hash is empty when the directory omitted it; chunk_count is derived from size.
    FileDescriptor file;
    std::vector<PeerAdvertisement> peers;
};

struct FileSummary {
    FileDescriptor file;
    std::size_t peers_count{0};
};

// Directory unreachable, or it answered with something other than the documented reply.
class DirectoryError : public Error {
public:
    explicit DirectoryError(const std::string& message, long http_status = 0)
        : Error(ErrorKind::Transport, message), http_status_(http_status) {}

    [[nodiscard]] long http_status() const noexcept { return http_status_; }

private:
    long http_status_;
};

class Directory {
public:
    virtual ~Directory() = default;

    virtual RegistrationResult register_peer(const FileDescriptor& file, const PeerAdvertisement& peer) = 0;
    // std::nullopt when the directory does not know the name.
    virtual std::optional<LookupResult> lookup(const std::string& file_name) = 0;
    virtual std::vector<FileSummary> list_files() = 0;
};

}  // namespace chunkswarm::directory
