#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chunkswarm {

using ChunkIndex = std::uint32_t;
using ChunkData = std::vector<std::uint8_t>;

struct PeerEndpoint {
    std::string ip;
    std::uint16_t port{0};

    bool operator==(const PeerEndpoint& other) const = default;
};

struct PeerAdvertisement {
    PeerEndpoint endpoint;
    std::vector<ChunkIndex> chunks;
};

struct FileDescriptor {
    std::string name;
    std::string content_hash;  // 40 lowercase hex characters
    std::uint64_t size{0};
    std::uint32_t chunk_count{0};
};

struct DownloadTask {
    PeerEndpoint peer;
    ChunkIndex chunk{0};
};

std::string endpoint_to_string(const PeerEndpoint& endpoint);
std::optional<PeerEndpoint> endpoint_from_string(const std::string& text);

std::string bytes_to_hex(const std::uint8_t* data, std::size_t length);
bool is_content_hash(const std::string& text);

}  // namespace chunkswarm
