#pragma once

#include "chunkswarm/directory/Directory.hpp"

#include <chrono>
#include <string>

namespace chunkswarm::directory {

// Directory reached over HTTP through libcurl. Transport failures and unexpected
// replies throw DirectoryError; a 404 from lookup is reported as std::nullopt.
class HttpDirectoryClient : public Directory {
public:
    explicit HttpDirectoryClient(std::string base_url, std::chrono::seconds timeout = std::chrono::seconds(5));

    RegistrationResult register_peer(const FileDescriptor& file, const PeerAdvertisement& peer) override;
    std::optional<LookupResult> lookup(const std::string& file_name) override;
    std::vector<FileSummary> list_files() override;

    [[nodiscard]] const std::string& base_url() const noexcept { return base_url_; }

private:
    struct HttpReply {
        long status{0};
        std::string body;
    };

    HttpReply perform(const std::string& path, const std::string* post_body) const;

    std::string base_url_;
    std::chrono::seconds timeout_;
};

}  // namespace chunkswarm::directory
