#include "chunkswarm/core/ChunkCodec.hpp"

#include "chunkswarm/crypto/Sha1.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace chunkswarm {

std::uint32_t chunk_count(std::uint64_t file_size) noexcept {
    const auto count = (file_size + kChunkSize - 1) / kChunkSize;
    return static_cast<std::uint32_t>(std::min<std::uint64_t>(count, std::numeric_limits<std::uint32_t>::max()));
}

ChunkRange chunk_range(ChunkIndex chunk, std::uint64_t file_size) {
    if (chunk >= chunk_count(file_size)) {
        throw std::out_of_range("Chunk " + std::to_string(chunk) + " outside file of "
                                + std::to_string(file_size) + " bytes");
    }
    ChunkRange range{};
    range.offset = static_cast<std::uint64_t>(chunk) * kChunkSize;
    range.length = std::min<std::uint64_t>(kChunkSize, file_size - range.offset);
    return range;
}

std::string hash_bytes(std::span<const std::uint8_t> data) {
    return crypto::Sha1::hex_digest(data);
}

std::string hash_file(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        throw std::runtime_error("Unable to open " + path.string() + " for hashing");
    }

    crypto::Sha1 hasher;
    std::vector<char> buffer(static_cast<std::size_t>(kChunkSize));
    while (stream) {
        stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto read = stream.gcount();
        if (read <= 0) {
            break;
        }
        hasher.update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(buffer.data()),
                                                    static_cast<std::size_t>(read)));
    }
    if (stream.bad()) {
        throw std::runtime_error("Read error while hashing " + path.string());
    }
    return hasher.finalize_hex();
}

FileDescriptor describe_file(const std::filesystem::path& path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw std::runtime_error("Unable to stat " + path.string() + ": " + ec.message());
    }

    FileDescriptor descriptor{};
    descriptor.name = path.filename().string();
    descriptor.size = static_cast<std::uint64_t>(size);
    descriptor.chunk_count = chunk_count(descriptor.size);
    descriptor.content_hash = hash_file(path);
    return descriptor;
}

}  // namespace chunkswarm
